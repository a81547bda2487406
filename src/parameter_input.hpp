#ifndef PARAMETER_INPUT_HPP_
#define PARAMETER_INPUT_HPP_
//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file parameter_input.hpp
//  \brief definition of class ParameterInput
//  Contains data structures used to store, and functions used to access, parameters
//  read from the input file.  See comments at start of parameter_input.cpp for more
//  information on the input file format.

#include <cstddef>
#include <iostream>
#include <list>
#include <string>
#include <vector>

#include "chemevo.hpp"

//----------------------------------------------------------------------------------------
//! \struct InputLine
//  \brief  node in a list of parameters contained within 1 input block

struct InputLine {
  std::string param_name;
  std::string param_value;   // value of the parameter is stored as a string!
  std::string param_comment;
};

//----------------------------------------------------------------------------------------
//! \class InputBlock
//  \brief node in a list of all input blocks contained within input file

class InputBlock {
 public:
  InputBlock() = default;
  explicit InputBlock(const std::string &name) : block_name(name) {}

  // data
  std::string block_name;
  std::size_t max_len_parname = 0;  // length of longest param_name, for nice output
  std::size_t max_len_parvalue = 0; // length of longest param_value, to format outputs
  std::list<InputLine> line;

  // functions
  InputLine* GetPtrToLine(const std::string &name);
};

//----------------------------------------------------------------------------------------
//! \class ParameterInput
//  \brief data and definitions of functions used to store and access input parameters
//  Functions are implemented in parameter_input.cpp

class ParameterInput {
 public:
  ParameterInput() = default;
  explicit ParameterInput(const std::string &input_filename);

  // data
  std::list<InputBlock> block;

  // functions
  void LoadFromStream(std::istream &is);
  void LoadFromFile(const std::string &input_filename);
  void ModifyFromCmdline(int argc, char *argv[]);
  void ParameterDump(std::ostream &os) const;
  bool DoesBlockExist(const std::string &name);
  bool DoesParameterExist(const std::string &block, const std::string &name);
  std::vector<std::string> ParameterNames(const std::string &block);

  int GetInteger(const std::string &block, const std::string &name);
  int GetOrAddInteger(const std::string &block, const std::string &name, int value);
  int SetInteger(const std::string &block, const std::string &name, int value);
  Real GetReal(const std::string &block, const std::string &name);
  Real GetOrAddReal(const std::string &block, const std::string &name, Real value);
  Real SetReal(const std::string &block, const std::string &name, Real value);
  bool GetBoolean(const std::string &block, const std::string &name);
  bool GetOrAddBoolean(const std::string &block, const std::string &name, bool value);
  bool SetBoolean(const std::string &block, const std::string &name, bool value);
  std::string GetString(const std::string &block, const std::string &name);
  std::string GetOrAddString(const std::string &block, const std::string &name,
                             const std::string &value);
  std::string SetString(const std::string &block, const std::string &name,
                        const std::string &value);

  // parse a boolean value the same way GetBoolean() does; false if not recognized
  static bool ParseBoolean(const std::string &value, bool &result);

 private:
  std::string last_filename_;  // last input file opened, to prevent duplicate reads

  InputBlock* FindOrAddBlock(const std::string &name);
  InputBlock* GetPtrToBlock(const std::string &name);
  const std::string &GetValue(const std::string &block, const std::string &name,
                              const char *caller);
  void ParseLine(InputBlock *pib, std::string line, std::string &name,
                 std::string &value, std::string &comment);
  void AddParameter(InputBlock *pib, const std::string &name, const std::string &value,
                    const std::string &comment);
};

#endif // PARAMETER_INPUT_HPP_
