// Copyright (C) 2020-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "jsonutils.hpp"

#include <glog/logging.h>

#include <memory>
#include <sstream>

namespace wager
{

bool
IsIntegerValue (const Json::Value& val)
{
  switch (val.type ())
    {
    case Json::intValue:
    case Json::uintValue:
      return true;

    default:
      return false;
    }
}

bool
ParseJson (const std::string& str, Json::Value& res)
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = false;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;

  const std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader ());
  std::string parseErrs;
  if (!reader->parse (str.data (), str.data () + str.size (), &res,
                      &parseErrs))
    {
      LOG (WARNING) << "Failed parsing JSON:\n" << parseErrs;
      return false;
    }

  return true;
}

std::string
SerialiseJson (const Json::Value& val)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = "";
  wbuilder["enableYAMLCompatibility"] = false;

  return Json::writeString (wbuilder, val);
}

} // namespace wager
