//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file parameter_input.cpp
//  \brief implementation of functions in class ParameterInput
//
// PURPOSE: Member functions of this class are used to read and parse the input file.
//   Functionality is loosely modeled after FORTRAN namelist.
//
// EXAMPLE of input file in 'Athena' format:
//  <blockname1>      # comment
//  input1 = 1        # integer value
//  input2 = 0.2      # real value
//  input3 = string   # string value
//  #
//  <blockname2>      # comment
//  input4 = true     # boolean value
//  <par_end>         # any lines after this are ignored
//
//  Each parameter name must be unique within a block.  Parameters are stored as strings
//  and converted to the requested type by the Get/GetOrAdd functions.

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "chemevo.hpp"
#include "parameter_input.hpp"

namespace {
//----------------------------------------------------------------------------------------
// strip leading and trailing whitespace

std::string Trim(const std::string &s) {
  std::size_t first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return std::string();
  std::size_t last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}
} // namespace

//----------------------------------------------------------------------------------------
// ParameterInput constructor that loads the named file immediately

ParameterInput::ParameterInput(const std::string &input_filename) {
  LoadFromFile(input_filename);
}

//----------------------------------------------------------------------------------------
//! \fn void ParameterInput::LoadFromStream(std::istream &is)
//  \brief Load input parameters from a stream

void ParameterInput::LoadFromStream(std::istream &is) {
  std::string line, block_name, param_name, param_value, param_comment;
  InputBlock *pib{nullptr};
  int line_num{-1}, blocks_found{0};

  while (std::getline(is, line)) {
    line_num++;
    line = Trim(line);
    if (line.empty()) continue;                  // skip blank line
    if (line.compare(0, 1, "#") == 0) continue;  // skip comments

    if (line.compare(0, 1, "<") == 0) {
      // a new block
      std::size_t last_char = line.find_first_of(">");
      if (last_char == std::string::npos) {
        std::cout << "### FATAL ERROR in function [ParameterInput::LoadFromStream]"
                  << std::endl << "Block name '" << line << "' in the input file on "
                  << "line " << line_num << " is not closed by '>'" << std::endl;
        std::exit(EXIT_FAILURE);
      }
      block_name.assign(line, 1, last_char - 1);
      if (block_name.compare("par_end") == 0) break;  // quit when <par_end> found
      pib = FindOrAddBlock(block_name);
      blocks_found++;
      continue;
    }

    if (blocks_found == 0) {
      std::cout << "### FATAL ERROR in function [ParameterInput::LoadFromStream]"
                << std::endl << "Input file must specify a block name before the first"
                << " parameter = value line" << std::endl;
      std::exit(EXIT_FAILURE);
    }
    // parse line and add name/value/comment strings (if found) to current block name
    ParseLine(pib, line, param_name, param_value, param_comment);
    AddParameter(pib, param_name, param_value, param_comment);
  }
  return;
}

//----------------------------------------------------------------------------------------
//! \fn void ParameterInput::LoadFromFile(const std::string &input_filename)
//  \brief Read the parameters from an input file. Reading the same file twice is a
//  no-op.

void ParameterInput::LoadFromFile(const std::string &input_filename) {
  if (input_filename.compare(last_filename_) == 0) return;

  std::ifstream infile(input_filename);
  if (!infile.is_open()) {
    std::cout << "### FATAL ERROR in function [ParameterInput::LoadFromFile]"
              << std::endl << "Input file '" << input_filename << "' could not be opened"
              << std::endl;
    std::exit(EXIT_FAILURE);
  }
  LoadFromStream(infile);
  last_filename_ = input_filename;
  return;
}

//----------------------------------------------------------------------------------------
//! \fn InputBlock* ParameterInput::FindOrAddBlock(const std::string &name)
//  \brief find or add specified InputBlock.  Returns pointer to block.

InputBlock* ParameterInput::FindOrAddBlock(const std::string &name) {
  InputBlock *pb = GetPtrToBlock(name);
  if (pb != nullptr) return pb;
  block.emplace_back(name);
  return &(block.back());
}

//----------------------------------------------------------------------------------------
//! \fn void ParameterInput::ParseLine()
//  \brief parse "name = value # comment" format, return name/value/comment strings.

void ParameterInput::ParseLine(InputBlock *pib, std::string line, std::string &name,
                               std::string &value, std::string &comment) {
  std::size_t first_char = line.find_first_of("#");  // find "#" (if any)
  if (first_char != std::string::npos) {
    comment = Trim(line.substr(first_char + 1));
    line.erase(first_char);
  } else {
    comment.clear();
  }

  std::size_t equal_char = line.find_first_of("=");
  if (equal_char == std::string::npos) {
    std::cout << "### FATAL ERROR in function [ParameterInput::ParseLine]" << std::endl
              << "Line '" << line << "' in block '" << pib->block_name << "' is not of "
              << "the form 'name = value'" << std::endl;
    std::exit(EXIT_FAILURE);
  }
  name = Trim(line.substr(0, equal_char));
  value = Trim(line.substr(equal_char + 1));
  return;
}

//----------------------------------------------------------------------------------------
//! \fn void ParameterInput::AddParameter()
//  \brief add name/value/comment tuple to the list of lines in block.  If a parameter
//  with the same name already exists, the value and comment are replaced.

void ParameterInput::AddParameter(InputBlock *pb, const std::string &name,
                                  const std::string &value, const std::string &comment) {
  InputLine *pl = pb->GetPtrToLine(name);
  if (pl != nullptr) {
    pl->param_value = value;
    pl->param_comment = comment;
  } else {
    InputLine new_line;
    new_line.param_name = name;
    new_line.param_value = value;
    new_line.param_comment = comment;
    pb->line.push_back(new_line);
  }
  pb->max_len_parname = std::max(pb->max_len_parname, name.length());
  pb->max_len_parvalue = std::max(pb->max_len_parvalue, value.length());
  return;
}

//----------------------------------------------------------------------------------------
//! \fn void ParameterInput::ModifyFromCmdline(int argc, char *argv[])
//  \brief parse commandline for changes to input parameters of the form
//  block/name=value.  Arguments without a '/' are skipped (they are driver options).

void ParameterInput::ModifyFromCmdline(int argc, char *argv[]) {
  for (int i = 1; i < argc; i++) {
    std::string input_text = argv[i];
    std::size_t slash_posn = input_text.find_first_of("/");
    std::size_t equal_posn = input_text.find_first_of("=");
    if (slash_posn == std::string::npos || equal_posn == std::string::npos ||
        slash_posn > equal_posn) {
      continue;
    }

    std::string block_name = input_text.substr(0, slash_posn);
    std::string param_name = input_text.substr(slash_posn + 1,
                                               equal_posn - slash_posn - 1);
    std::string param_value = input_text.substr(equal_posn + 1);

    InputBlock *pb = GetPtrToBlock(block_name);
    if (pb == nullptr) {
      std::cout << "### FATAL ERROR in function [ParameterInput::ModifyFromCmdline]"
                << std::endl << "Block name '" << block_name << "' on command line not "
                << "found" << std::endl;
      std::exit(EXIT_FAILURE);
    }
    AddParameter(pb, param_name, param_value, "Updated via command line");
  }
  return;
}

//----------------------------------------------------------------------------------------
//! \fn InputBlock* ParameterInput::GetPtrToBlock(const std::string &name)
//  \brief return pointer to specified InputBlock if it exists, nullptr otherwise

InputBlock* ParameterInput::GetPtrToBlock(const std::string &name) {
  for (auto &b : block) {
    if (name.compare(b.block_name) == 0) return &b;
  }
  return nullptr;
}

//----------------------------------------------------------------------------------------
//! \fn InputLine* InputBlock::GetPtrToLine(const std::string &name)
//  \brief return pointer to InputLine containing specified parameter if it exists

InputLine* InputBlock::GetPtrToLine(const std::string &name) {
  for (auto &l : line) {
    if (name.compare(l.param_name) == 0) return &l;
  }
  return nullptr;
}

//----------------------------------------------------------------------------------------
// DoesBlockExist / DoesParameterExist / ParameterNames

bool ParameterInput::DoesBlockExist(const std::string &name) {
  return (GetPtrToBlock(name) != nullptr);
}

bool ParameterInput::DoesParameterExist(const std::string &block,
                                        const std::string &name) {
  InputBlock *pb = GetPtrToBlock(block);
  if (pb == nullptr) return false;
  return (pb->GetPtrToLine(name) != nullptr);
}

std::vector<std::string> ParameterInput::ParameterNames(const std::string &block) {
  std::vector<std::string> names;
  InputBlock *pb = GetPtrToBlock(block);
  if (pb == nullptr) return names;
  for (auto &l : pb->line) {
    names.push_back(l.param_name);
  }
  return names;
}

//----------------------------------------------------------------------------------------
//! \fn const std::string &ParameterInput::GetValue()
//  \brief returns string value of existing parameter; fatal error if it does not exist

const std::string &ParameterInput::GetValue(const std::string &block,
                                            const std::string &name,
                                            const char *caller) {
  InputBlock *pb = GetPtrToBlock(block);
  if (pb == nullptr) {
    std::cout << "### FATAL ERROR in function [ParameterInput::" << caller << "]"
              << std::endl << "Block name '" << block << "' not found when trying to set "
              << "value for parameter '" << name << "'" << std::endl;
    std::exit(EXIT_FAILURE);
  }
  InputLine *pl = pb->GetPtrToLine(name);
  if (pl == nullptr) {
    std::cout << "### FATAL ERROR in function [ParameterInput::" << caller << "]"
              << std::endl << "Parameter name '" << name << "' not found in block '"
              << block << "'" << std::endl;
    std::exit(EXIT_FAILURE);
  }
  return pl->param_value;
}

//----------------------------------------------------------------------------------------
//! \fn bool ParameterInput::ParseBoolean(const std::string &value, bool &result)
//  \brief accepts 0/1, true/false, on/off, yes/no (case insensitive)

bool ParameterInput::ParseBoolean(const std::string &value, bool &result) {
  std::string val = Trim(value);
  std::transform(val.begin(), val.end(), val.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (val == "1" || val == "true" || val == "on" || val == "yes") {
    result = true;
    return true;
  }
  if (val == "0" || val == "false" || val == "off" || val == "no") {
    result = false;
    return true;
  }
  return false;
}

//----------------------------------------------------------------------------------------
// Get functions: return value of parameter, or fatal error if it does not exist

int ParameterInput::GetInteger(const std::string &block, const std::string &name) {
  return atoi(GetValue(block, name, "GetInteger").c_str());
}

Real ParameterInput::GetReal(const std::string &block, const std::string &name) {
  return static_cast<Real>(atof(GetValue(block, name, "GetReal").c_str()));
}

bool ParameterInput::GetBoolean(const std::string &block, const std::string &name) {
  const std::string &val = GetValue(block, name, "GetBoolean");
  bool result = false;
  if (!ParseBoolean(val, result)) {
    std::cout << "### FATAL ERROR in function [ParameterInput::GetBoolean]" << std::endl
              << "Parameter '" << block << "/" << name << "' = '" << val
              << "' is not a boolean" << std::endl;
    std::exit(EXIT_FAILURE);
  }
  return result;
}

std::string ParameterInput::GetString(const std::string &block,
                                      const std::string &name) {
  return GetValue(block, name, "GetString");
}

//----------------------------------------------------------------------------------------
// GetOrAdd functions: return value of parameter if it exists, otherwise add it with the
// default value and return that

int ParameterInput::GetOrAddInteger(const std::string &block, const std::string &name,
                                    int def_value) {
  if (DoesParameterExist(block, name)) return GetInteger(block, name);
  InputBlock *pb = FindOrAddBlock(block);
  AddParameter(pb, name, std::to_string(def_value), "Default value added at run time");
  return def_value;
}

Real ParameterInput::GetOrAddReal(const std::string &block, const std::string &name,
                                  Real def_value) {
  if (DoesParameterExist(block, name)) return GetReal(block, name);
  InputBlock *pb = FindOrAddBlock(block);
  std::stringstream ss;
  ss.precision(std::numeric_limits<Real>::max_digits10);
  ss << def_value;
  AddParameter(pb, name, ss.str(), "Default value added at run time");
  return def_value;
}

bool ParameterInput::GetOrAddBoolean(const std::string &block, const std::string &name,
                                     bool def_value) {
  if (DoesParameterExist(block, name)) return GetBoolean(block, name);
  InputBlock *pb = FindOrAddBlock(block);
  AddParameter(pb, name, def_value ? "true" : "false",
               "Default value added at run time");
  return def_value;
}

std::string ParameterInput::GetOrAddString(const std::string &block,
                                           const std::string &name,
                                           const std::string &def_value) {
  if (DoesParameterExist(block, name)) return GetString(block, name);
  InputBlock *pb = FindOrAddBlock(block);
  AddParameter(pb, name, def_value, "Default value added at run time");
  return def_value;
}

//----------------------------------------------------------------------------------------
// Set functions: set parameter (adding it if necessary) and return the value

int ParameterInput::SetInteger(const std::string &block, const std::string &name,
                               int value) {
  AddParameter(FindOrAddBlock(block), name, std::to_string(value), "");
  return value;
}

Real ParameterInput::SetReal(const std::string &block, const std::string &name,
                             Real value) {
  std::stringstream ss;
  ss.precision(std::numeric_limits<Real>::max_digits10);
  ss << value;
  AddParameter(FindOrAddBlock(block), name, ss.str(), "");
  return value;
}

bool ParameterInput::SetBoolean(const std::string &block, const std::string &name,
                                bool value) {
  AddParameter(FindOrAddBlock(block), name, value ? "true" : "false", "");
  return value;
}

std::string ParameterInput::SetString(const std::string &block, const std::string &name,
                                      const std::string &value) {
  AddParameter(FindOrAddBlock(block), name, value, "");
  return value;
}

//----------------------------------------------------------------------------------------
//! \fn void ParameterInput::ParameterDump(std::ostream &os)
//  \brief output entire InputBlock/InputLine hierarchy to specified stream

void ParameterInput::ParameterDump(std::ostream &os) const {
  os << "#------------------------- PAR_DUMP -------------------------" << std::endl;

  for (const auto &b : block) {
    os << "<" << b.block_name << ">" << std::endl;
    for (const auto &l : b.line) {
      os << std::left << std::setw(b.max_len_parname) << l.param_name << " = "
         << std::setw(b.max_len_parvalue) << l.param_value;
      if (!l.param_comment.empty()) os << "  # " << l.param_comment;
      os << std::endl;
    }
  }
  os << "<par_end>" << std::endl;
  return;
}
