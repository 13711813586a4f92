// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <typeinfo>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "RaterConfigurationFileReader.h"

namespace plrank
{
  template <class T>
  static T tryCast(const std::string& parameter, const std::string& inputString)
  {
    try
      {
	return boost::lexical_cast<T>(inputString);
      }
    catch (const boost::bad_lexical_cast& e)
      {
	throw RaterConfigurationException("Configuration parameter " + parameter + ": cannot convert '" +
					  inputString + "' to " + typeid(T).name() + " (" + e.what() + ")");
      }
  }

  static bool parseSwitch(const std::string& parameter, const std::string& value)
  {
    std::string flag = boost::algorithm::to_lower_copy(value);

    if (flag == "1" || flag == "true" || flag == "yes" || flag == "on")
      return true;
    if (flag == "0" || flag == "false" || flag == "no" || flag == "off")
      return false;

    throw RaterConfigurationException("Configuration parameter " + parameter + ": expected a boolean, found '" + value + "'");
  }

  RaterConfigurationFileReader::RaterConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<FitConfiguration> RaterConfigurationFileReader::readConfigurationFile() const
  {
    boost::filesystem::path configurationPath(mConfigurationFileName);
    if (!boost::filesystem::exists(configurationPath))
      throw RaterConfigurationException("Configuration file " + configurationPath.string() + " does not exist");

    auto configuration = std::make_shared<FitConfiguration>();

    try
      {
	io::CSVReader<2, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>> csvConfigFile(mConfigurationFileName);
	csvConfigFile.read_header(io::ignore_extra_column, "Parameter", "Value");

	std::string parameter, value;
	while (csvConfigFile.read_row(parameter, value))
	  {
	    if (parameter.empty())
	      continue;

	    applySetting(*configuration, parameter, value);
	  }
      }
    catch (const io::error::base& e)
      {
	throw RaterConfigurationException("Error reading configuration file " + mConfigurationFileName + ": " + e.what());
      }

    return configuration;
  }

  void RaterConfigurationFileReader::applySetting(FitConfiguration& configuration,
						  const std::string& parameter,
						  const std::string& value) const
  {
    const std::string key = boost::algorithm::to_lower_copy(parameter);

    try
      {
	if (key == "tolerance")
	  configuration.setTolerance(tryCast<double>(parameter, value));
	else if (key == "checkprecondition")
	  configuration.setCheckPrecondition(parseSwitch(parameter, value));
	else if (key == "normalize")
	  configuration.setNormalize(parseSwitch(parameter, value));
	else if (key == "formulation")
	  configuration.setFormulation(formulationFromString(value));
	else if (key == "maxiterations")
	  {
	    if (boost::algorithm::iequals(value, "none"))
	      configuration.clearMaxIterations();
	    else
	      configuration.setMaxIterations(tryCast<unsigned int>(parameter, value));
	  }
	else if (key == "parallel")
	  configuration.setParallel(parseSwitch(parameter, value));
	else if (key == "verbose")
	  configuration.setVerbose(parseSwitch(parameter, value));
	else
	  throw RaterConfigurationException("Unknown configuration parameter: " + parameter);
      }
    catch (const FitConfigurationException& e)
      {
	throw RaterConfigurationException("Configuration parameter " + parameter + ": " + e.what());
      }
  }
}
