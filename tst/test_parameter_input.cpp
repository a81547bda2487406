//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file test_parameter_input.cpp
//  \brief tests of the input file parser

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "chemevo.hpp"
#include "parameter_input.hpp"

namespace {
const char *kInput =
    "# comment line before any block\n"
    "<job>\n"
    "basename = run1        # name of history file\n"
    "\n"
    "<time>\n"
    "dt       = 30.0\n"
    "time_tot = 12000\n"
    "\n"
    "<snia_dtd>\n"
    "func          = single_degenerate\n"
    "normalize     = yes\n"
    "nia_per_mstar = 1.54e-3\n"
    "<par_end>\n"
    "<ignored>\n"
    "x = 1\n";
}

class ParameterInputTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::istringstream is(kInput);
    pin.LoadFromStream(is);
  }
  ParameterInput pin;
};

TEST_F(ParameterInputTest, ReadsTypedValues) {
  EXPECT_EQ(pin.GetString("job", "basename"), "run1");
  EXPECT_DOUBLE_EQ(pin.GetReal("time", "dt"), 30.0);
  EXPECT_EQ(pin.GetInteger("time", "time_tot"), 12000);
  EXPECT_TRUE(pin.GetBoolean("snia_dtd", "normalize"));
  EXPECT_DOUBLE_EQ(pin.GetReal("snia_dtd", "nia_per_mstar"), 1.54e-3);
}

TEST_F(ParameterInputTest, StopsAtParEnd) {
  EXPECT_TRUE(pin.DoesBlockExist("snia_dtd"));
  EXPECT_FALSE(pin.DoesBlockExist("ignored"));
}

TEST_F(ParameterInputTest, ParameterNamesKeepFileOrder) {
  std::vector<std::string> names = pin.ParameterNames("snia_dtd");
  ASSERT_EQ(names.size(), 3u);
  EXPECT_EQ(names[0], "func");
  EXPECT_EQ(names[1], "normalize");
  EXPECT_EQ(names[2], "nia_per_mstar");
  EXPECT_TRUE(pin.ParameterNames("no_such_block").empty());
}

TEST_F(ParameterInputTest, GetOrAddInsertsDefaultOnlyWhenMissing) {
  EXPECT_DOUBLE_EQ(pin.GetOrAddReal("time", "dt", 10.0), 30.0);
  EXPECT_FALSE(pin.DoesParameterExist("star_formation", "sfr0"));
  EXPECT_DOUBLE_EQ(pin.GetOrAddReal("star_formation", "sfr0", 2.5), 2.5);
  EXPECT_TRUE(pin.DoesParameterExist("star_formation", "sfr0"));
  EXPECT_DOUBLE_EQ(pin.GetReal("star_formation", "sfr0"), 2.5);
}

TEST_F(ParameterInputTest, CommandLineOverridesExistingBlock) {
  std::string exe = "chemevo", opt = "-i", file = "in.txt", ovr = "time/dt=15";
  char *argv[] = {&exe[0], &opt[0], &file[0], &ovr[0]};
  pin.ModifyFromCmdline(4, argv);
  EXPECT_DOUBLE_EQ(pin.GetReal("time", "dt"), 15.0);
}

TEST_F(ParameterInputTest, SetReplacesValue) {
  pin.SetString("snia_dtd", "func", "power_law");
  EXPECT_EQ(pin.GetString("snia_dtd", "func"), "power_law");
  pin.SetBoolean("snia_dtd", "normalize", false);
  EXPECT_FALSE(pin.GetBoolean("snia_dtd", "normalize"));
}

TEST_F(ParameterInputTest, DumpCanBeReloaded) {
  std::stringstream dump;
  pin.ParameterDump(dump);
  ParameterInput copy;
  copy.LoadFromStream(dump);
  EXPECT_EQ(copy.GetString("snia_dtd", "func"), "single_degenerate");
  EXPECT_DOUBLE_EQ(copy.GetReal("time", "time_tot"), 12000.0);
}

TEST(ParseBoolean, AcceptsCommonSpellings) {
  bool value = false;
  for (const char *t : {"true", "1", "on", "yes"}) {
    value = false;
    EXPECT_TRUE(ParameterInput::ParseBoolean(t, value)) << t;
    EXPECT_TRUE(value) << t;
  }
  for (const char *f : {"false", "0", "off", "no"}) {
    value = true;
    EXPECT_TRUE(ParameterInput::ParseBoolean(f, value)) << f;
    EXPECT_FALSE(value) << f;
  }
  EXPECT_FALSE(ParameterInput::ParseBoolean("maybe", value));
}
