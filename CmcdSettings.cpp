/*
 * If not stated otherwise in this file or this component's license file the
 * following copyright and licenses apply:
 *
 * Copyright 2024 RDK Management
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
*/

/**
 * @file CmcdSettings.cpp
 * @brief Owner prioritized settings for CMCD
 */

#include "CmcdSettings.h"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <sstream>
#include <strings.h>

#define ERROR_TEXT_BAD_RANGE "Attempt to set config value out of valid range"

/**
 * @brief categories of valid ranges, used for value validation
 */
typedef enum
{
	eCONFIG_RANGE_ANY,
	eCONFIG_RANGE_THROUGHPUT_MULTIPLIER,	// 0 to 10
	eCONFIG_RANGE_MAX_VALUE
} ConfigValidRange;

static const struct
{
	int minValue;
	int maxValue;
	ConfigValidRange type;
} mConfigValueValidRange[] =
{
	{ 0, INT_MAX, eCONFIG_RANGE_ANY },
	{ 0, 10, eCONFIG_RANGE_THROUGHPUT_MULTIPLIER },
};

static const char *mOwnerLookupTable[] =
{
	"def",
	"oper",
	"app",
	"cfg",
	"unknown"
};

struct ConfigLookupEntryInt
{
	int defaultValue;
	const char* cmdString;
	CmcdConfigSettingInt configEnum;
	ConfigValidRange validRange;
};

struct ConfigLookupEntryFloat
{
	double defaultValue;
	const char* cmdString;
	CmcdConfigSettingFloat configEnum;
	ConfigValidRange validRange;
};

struct ConfigLookupEntryBool
{
	bool defaultValue;
	const char* cmdString;
	CmcdConfigSettingBool configEnum;
};

struct ConfigLookupEntryString
{
	const char *defaultValue;
	const char* cmdString;
	CmcdConfigSettingString configEnum;
};

/**
 * @brief CmcdConfigSettingBool metadata, order must match the enum
 */
static const ConfigLookupEntryBool mConfigLookupTableBool[CMCDCONFIG_BOOL_COUNT] =
{
	{true,"enableCMCD",eCMCDConfig_EnableCMCD},
	{true,"cmcdAllowBitrate",eCMCDConfig_AllowBitrate},
	{true,"cmcdAllowBufferLength",eCMCDConfig_AllowBufferLength},
	{true,"cmcdAllowContentId",eCMCDConfig_AllowContentId},
	{true,"cmcdAllowSessionId",eCMCDConfig_AllowSessionId},
	{true,"cmcdAllowMaxRequestedThroughput",eCMCDConfig_AllowMaxRequestedThroughput},
	{false,"info",eCMCDConfig_InfoLogging},
	{false,"debug",eCMCDConfig_DebugLogging},
	{false,"trace",eCMCDConfig_TraceLogging},
};

static const ConfigLookupEntryInt mConfigLookupTableInt[CMCDCONFIG_INT_COUNT] =
{
	{0,"cmcdMaxRequestedThroughput",eCMCDConfig_MaxRequestedThroughput,eCONFIG_RANGE_ANY},
};

static const ConfigLookupEntryFloat mConfigLookupTableFloat[CMCDCONFIG_FLOAT_COUNT] =
{
	{0.0,"cmcdThroughputMultiplier",eCMCDConfig_ThroughputMultiplier,eCONFIG_RANGE_THROUGHPUT_MULTIPLIER},
};

static const ConfigLookupEntryString mConfigLookupTableString[CMCDCONFIG_STRING_COUNT] =
{
	{"","cmcdSessionId",eCMCDConfig_SessionId},
	{"","cmcdContentId",eCMCDConfig_ContentId},
	{"","cmcdCustomObject",eCMCDConfig_CustomObject},
	{"","cmcdCustomRequest",eCMCDConfig_CustomRequest},
	{"","cmcdCustomSession",eCMCDConfig_CustomSession},
	{"","cmcdCustomStatus",eCMCDConfig_CustomStatus},
	{"","logLevel",eCMCDConfig_LogLevel},
};

/**
 * @brief Maps setting names to their enum, for text and json input
 */
class ConfigLookup
{
private:
	std::map<std::string, ConfigLookupEntryBool> lookupBool;
	std::map<std::string, ConfigLookupEntryInt> lookupInt;
	std::map<std::string, ConfigLookupEntryFloat> lookupFloat;
	std::map<std::string, ConfigLookupEntryString> lookupString;

public:
	static bool ConfigStringValueToBool( const char *value_cstr )
	{
		bool rc = false;
		if( value_cstr )
		{
			if( isdigit(*value_cstr) )
			{
				int ival = atoi(value_cstr);
				if( ival == 1 )
				{
					rc = true;
				}
				else if( ival!=0 )
				{
					CMCDLOG_ERR( "unexpected input: %s", value_cstr );
				}
			}
			else if( strcasecmp(value_cstr,"true")==0 )
			{
				rc = true;
			}
			else if( strcasecmp(value_cstr,"false")!=0 )
			{
				CMCDLOG_ERR( "unexpected input: %s", value_cstr );
			}
		}
		return rc;
	}

	bool Process( CmcdSettings *settings, ConfigPriority owner, const std::string &key, const std::string &value ) const
	{ // used while parsing text settings
		const char *value_cstr = value.c_str();
		auto iterBool = lookupBool.find(key);
		if( iterBool != lookupBool.end() )
		{
			auto cfg = iterBool->second;
			CMCDLOG_MIL("Parsed value for cfg property %s - %s", key.c_str(), value_cstr );
			if( value.empty() )
			{
				bool currentValue = settings->GetConfigValue(cfg.configEnum);
				settings->SetConfigValue( owner, cfg.configEnum, !currentValue );
			}
			else
			{
				settings->SetConfigValue( owner, cfg.configEnum, ConfigStringValueToBool(value_cstr) );
			}
			return true;
		}
		auto iterInt = lookupInt.find(key);
		if( iterInt != lookupInt.end() )
		{
			settings->SetConfigValue( owner, iterInt->second.configEnum, atoi(value_cstr) );
			return true;
		}
		auto iterFloat = lookupFloat.find(key);
		if( iterFloat != lookupFloat.end() )
		{
			settings->SetConfigValue( owner, iterFloat->second.configEnum, atof(value_cstr) );
			return true;
		}
		auto iterString = lookupString.find(key);
		if( iterString != lookupString.end() )
		{
			if( value.size() )
			{
				settings->SetConfigValue( owner, iterString->second.configEnum, value );
			}
			return true;
		}
		CMCDLOG_WARN("unknown cfg property: %s", key.c_str());
		return false;
	}

	bool Process( CmcdSettings *settings, ConfigPriority owner, const cJSON *searchObj ) const
	{ // used while parsing json settings
		if( !searchObj->string )
		{
			return false;
		}
		std::string keyname = searchObj->string;
		auto iterBool = lookupBool.find(keyname);
		if( iterBool != lookupBool.end() )
		{
			if( !cJSON_IsBool(searchObj) )
			{
				CMCDLOG_ERR("Invalid format for %s", keyname.c_str());
				return false;
			}
			bool conv = cJSON_IsTrue(searchObj);
			settings->SetConfigValue( owner, iterBool->second.configEnum, conv );
			CMCDLOG_MIL("Parsed value for property %s - %s", keyname.c_str(), conv?"true":"false");
			return true;
		}
		auto iterInt = lookupInt.find(keyname);
		if( iterInt != lookupInt.end() )
		{
			if( !cJSON_IsNumber(searchObj) )
			{
				CMCDLOG_ERR("Invalid format for %s", keyname.c_str());
				return false;
			}
			int conv = searchObj->valueint;
			settings->SetConfigValue( owner, iterInt->second.configEnum, conv );
			CMCDLOG_MIL("Parsed value for property %s - %d", keyname.c_str(), conv);
			return true;
		}
		auto iterFloat = lookupFloat.find(keyname);
		if( iterFloat != lookupFloat.end() )
		{
			if( !cJSON_IsNumber(searchObj) )
			{
				CMCDLOG_ERR("Invalid format for %s", keyname.c_str());
				return false;
			}
			double conv = searchObj->valuedouble;
			settings->SetConfigValue( owner, iterFloat->second.configEnum, conv );
			CMCDLOG_MIL("Parsed value for property %s - %f", keyname.c_str(), conv);
			return true;
		}
		auto iterString = lookupString.find(keyname);
		if( iterString != lookupString.end() )
		{
			if( !cJSON_IsString(searchObj) || searchObj->valuestring == NULL )
			{
				CMCDLOG_ERR("Invalid format for %s", keyname.c_str());
				return false;
			}
			settings->SetConfigValue( owner, iterString->second.configEnum, std::string(searchObj->valuestring) );
			CMCDLOG_MIL("Parsed value for property %s - %s", keyname.c_str(), searchObj->valuestring);
			return true;
		}
		CMCDLOG_WARN("unknown cfg property: %s", keyname.c_str());
		return false;
	}

	ConfigLookup()
	{
		for( int i=0; i<CMCDCONFIG_BOOL_COUNT; i++ )
		{
			const ConfigLookupEntryBool &entry = mConfigLookupTableBool[i];
			lookupBool[entry.cmdString] = entry;
		}
		for( int i=0; i<CMCDCONFIG_INT_COUNT; i++ )
		{
			const ConfigLookupEntryInt &entry = mConfigLookupTableInt[i];
			lookupInt[entry.cmdString] = entry;
		}
		for( int i=0; i<CMCDCONFIG_FLOAT_COUNT; i++ )
		{
			const ConfigLookupEntryFloat &entry = mConfigLookupTableFloat[i];
			lookupFloat[entry.cmdString] = entry;
		}
		for( int i=0; i<CMCDCONFIG_STRING_COUNT; i++ )
		{
			const ConfigLookupEntryString &entry = mConfigLookupTableString[i];
			lookupString[entry.cmdString] = entry;
		}
	}
};

static const ConfigLookup& GetConfigLookup()
{
	static ConfigLookup lookup;
	return lookup;
}

static bool InRange( ConfigValidRange validRange, double value )
{
	const auto &range = mConfigValueValidRange[validRange];
	return !( value<range.minValue || value>range.maxValue );
}

/**
 * @brief CmcdSettings Constructor
 */
CmcdSettings::CmcdSettings() : mMutex()
{
	for( int i=0; i<CMCDCONFIG_BOOL_COUNT; i++ )
	{
		configValueBool[i].value = configValueBool[i].lastvalue = mConfigLookupTableBool[i].defaultValue;
	}
	for( int i=0; i<CMCDCONFIG_INT_COUNT; i++ )
	{
		configValueInt[i].value = configValueInt[i].lastvalue = mConfigLookupTableInt[i].defaultValue;
	}
	for( int i=0; i<CMCDCONFIG_FLOAT_COUNT; i++ )
	{
		configValueFloat[i].value = configValueFloat[i].lastvalue = mConfigLookupTableFloat[i].defaultValue;
	}
	for( int i=0; i<CMCDCONFIG_STRING_COUNT; i++ )
	{
		configValueString[i].value = configValueString[i].lastvalue = mConfigLookupTableString[i].defaultValue;
	}
}

const char * CmcdSettings::GetConfigName(CmcdConfigSettingBool cfg )
{
	return mConfigLookupTableBool[cfg].cmdString;
}

const char * CmcdSettings::GetConfigName(CmcdConfigSettingInt cfg )
{
	return mConfigLookupTableInt[cfg].cmdString;
}

const char * CmcdSettings::GetConfigName(CmcdConfigSettingFloat cfg )
{
	return mConfigLookupTableFloat[cfg].cmdString;
}

const char * CmcdSettings::GetConfigName(CmcdConfigSettingString cfg )
{
	return mConfigLookupTableString[cfg].cmdString;
}

const char * CmcdSettings::GetConfigOwnerName(ConfigPriority owner)
{
	if( owner < CMCD_DEFAULT_SETTING || owner > CMCD_MAX_SETTING )
	{
		owner = CMCD_MAX_SETTING;
	}
	return mOwnerLookupTable[owner];
}

void CmcdSettings::SetConfigValue(ConfigPriority newowner, CmcdConfigSettingBool cfg , const bool &value)
{
	const char * cfgName = GetConfigName(cfg);
	std::lock_guard<std::mutex> guard(mMutex);
	ConfigValueBool &setting = configValueBool[cfg];
	if(setting.owner <= newowner )
	{
		if(setting.owner != newowner)
		{
			setting.lastvalue = setting.value;
			setting.lastowner = setting.owner;
		}
		setting.value = value;
		setting.owner = newowner;
		CMCDLOG_MIL("%s New Owner[%d]",cfgName,newowner);
	}
	else
	{
		CMCDLOG_WARN("%s Owner[%d] not allowed to Set ,current Owner[%d]",cfgName,newowner,setting.owner);
	}
}

void CmcdSettings::SetConfigValue(ConfigPriority newowner, CmcdConfigSettingInt cfg , const int &value)
{
	const auto &cfgInfo = mConfigLookupTableInt[cfg];
	if( !InRange(cfgInfo.validRange, value) )
	{
		CMCDLOG_ERR("%s: %s (%d)", cfgInfo.cmdString, ERROR_TEXT_BAD_RANGE, value);
		return;
	}
	std::lock_guard<std::mutex> guard(mMutex);
	ConfigValueInt &setting = configValueInt[cfg];
	if(setting.owner <= newowner )
	{
		if(setting.owner != newowner)
		{
			setting.lastvalue = setting.value;
			setting.lastowner = setting.owner;
		}
		setting.value = value;
		setting.owner = newowner;
		CMCDLOG_MIL("%s New Owner[%d]", cfgInfo.cmdString, newowner);
	}
	else
	{
		CMCDLOG_WARN("%s Owner[%d] not allowed to Set ,current Owner[%d]", cfgInfo.cmdString, newowner, setting.owner);
	}
}

void CmcdSettings::SetConfigValue(ConfigPriority newowner, CmcdConfigSettingFloat cfg , const double &value)
{
	const auto &cfgInfo = mConfigLookupTableFloat[cfg];
	if( !InRange(cfgInfo.validRange, value) )
	{
		CMCDLOG_ERR("%s: %s (%f)", cfgInfo.cmdString, ERROR_TEXT_BAD_RANGE, value);
		return;
	}
	std::lock_guard<std::mutex> guard(mMutex);
	ConfigValueFloat &setting = configValueFloat[cfg];
	if(setting.owner <= newowner )
	{
		if(setting.owner != newowner)
		{
			setting.lastvalue = setting.value;
			setting.lastowner = setting.owner;
		}
		setting.value = value;
		setting.owner = newowner;
		CMCDLOG_MIL("%s New Owner[%d]", cfgInfo.cmdString, newowner);
	}
	else
	{
		CMCDLOG_WARN("%s Owner[%d] not allowed to Set ,current Owner[%d]", cfgInfo.cmdString, newowner, setting.owner);
	}
}

void CmcdSettings::SetConfigValue(ConfigPriority newowner, CmcdConfigSettingString cfg , const std::string &value)
{
	const char * cfgName = GetConfigName(cfg);
	std::lock_guard<std::mutex> guard(mMutex);
	ConfigValueString &setting = configValueString[cfg];
	if(setting.owner <= newowner )
	{
		if(setting.owner != newowner)
		{
			setting.lastvalue = setting.value;
			setting.lastowner = setting.owner;
		}
		setting.value = value;
		setting.owner = newowner;
		CMCDLOG_MIL("%s New Owner[%d]",cfgName,newowner);
	}
	else
	{
		CMCDLOG_WARN("%s Owner[%d] not allowed to Set ,current Owner[%d]",cfgName,newowner,setting.owner);
	}
}

bool CmcdSettings::IsConfigSet(CmcdConfigSettingBool cfg) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	return configValueBool[cfg].value;
}

bool CmcdSettings::GetConfigValue(CmcdConfigSettingBool cfg) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	return configValueBool[cfg].value;
}

int CmcdSettings::GetConfigValue(CmcdConfigSettingInt cfg) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	return configValueInt[cfg].value;
}

double CmcdSettings::GetConfigValue(CmcdConfigSettingFloat cfg) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	return configValueFloat[cfg].value;
}

std::string CmcdSettings::GetConfigValue(CmcdConfigSettingString cfg) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	return configValueString[cfg].value;
}

ConfigPriority CmcdSettings::GetConfigOwner(CmcdConfigSettingBool cfg) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	return configValueBool[cfg].owner;
}

ConfigPriority CmcdSettings::GetConfigOwner(CmcdConfigSettingInt cfg) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	return configValueInt[cfg].owner;
}

ConfigPriority CmcdSettings::GetConfigOwner(CmcdConfigSettingFloat cfg) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	return configValueFloat[cfg].owner;
}

ConfigPriority CmcdSettings::GetConfigOwner(CmcdConfigSettingString cfg) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	return configValueString[cfg].owner;
}

/**
 * @brief ProcessConfigText - Function to parse and process one line of configuration text
 */
void CmcdSettings::ProcessConfigText(const std::string &line, ConfigPriority owner )
{
	if( line.empty() )
	{
		return;
	}
	char c = line[0];
	if( c<' ' )
	{ // ignore newline
	}
	else if( c == '#')
	{ // ignore comments
	}
	else
	{
		std::string cfg = line;
		//trim whitespace from the end of the string
		cfg.erase(std::find_if(cfg.rbegin(), cfg.rend(), [](unsigned char ch) {return !std::isspace(ch);}).base(), cfg.end());
		std::string key,value;
		std::size_t delimiterPos = cfg.find("=");
		if(delimiterPos != std::string::npos)
		{
			key = cfg.substr(0, delimiterPos);
			key.erase(std::remove_if(key.begin(), key.end(), ::isspace), key.end());
			value = cfg.substr(delimiterPos + 1);
			std::size_t position = value.find_first_not_of(' ');
			if( position == std::string::npos )
			{
				CMCDLOG_WARN( "unexpected cfg: '%s'", cfg.c_str() );
				value.clear();
			}
			else
			{
				value = value.substr(position);
			}
		}
		else
		{
			key = cfg;
			key.erase(std::remove_if(key.begin(), key.end(), ::isspace), key.end());
		}
		if( !key.empty() )
		{
			(void)GetConfigLookup().Process( this, owner, key, value );
		}
	}
}

/**
 * @brief ProcessConfigJson - Function to parse and process json configuration
 */
bool CmcdSettings::ProcessConfigJson(const cJSON *cfgdata, ConfigPriority owner )
{
	if( cfgdata == NULL || !cJSON_IsObject(cfgdata) )
	{
		CMCDLOG_ERR("cfg is not a json object");
		return false;
	}
	for( const cJSON *searchObj = cfgdata->child; NULL != searchObj; searchObj = searchObj->next )
	{
		(void)GetConfigLookup().Process( this, owner, searchObj );
	}
	return true;
}

bool CmcdSettings::ParseCmcdCfgJsonString(const std::string &cfg, ConfigPriority owner)
{
	bool retVal = false;
	cJSON *cfgdata = cJSON_Parse(cfg.c_str());
	if( cfgdata )
	{
		retVal = ProcessConfigJson(cfgdata, owner);
		cJSON_Delete(cfgdata);
	}
	else
	{
		CMCDLOG_ERR("Invalid json cfg '%s'", cfg.c_str());
	}
	return retVal;
}

/**
 * @brief ReadCmcdCfgTxtFile - Function to parse and process configuration file in text format
 */
bool CmcdSettings::ReadCmcdCfgTxtFile(const std::string &path, ConfigPriority owner)
{
	std::ifstream f(path, std::ifstream::in | std::ifstream::binary);
	if( !f.good() )
	{
		CMCDLOG_ERR("unable to open %s", path.c_str());
		return false;
	}
	CMCDLOG_MIL("opened %s", path.c_str());
	std::string buf;
	while( std::getline(f, buf) )
	{
		ProcessConfigText(buf, owner);
	}
	ConfigureLogSettings();
	return true;
}

/**
 * @brief ReadCmcdCfgJsonFile - Function to parse and process configuration file in json format
 */
bool CmcdSettings::ReadCmcdCfgJsonFile(const std::string &path, ConfigPriority owner)
{
	std::ifstream f(path, std::ifstream::in | std::ifstream::binary);
	if( !f.good() )
	{
		CMCDLOG_ERR("unable to open %s", path.c_str());
		return false;
	}
	CMCDLOG_MIL("opened %s", path.c_str());
	std::stringstream buffer;
	buffer << f.rdbuf();
	bool retVal = ParseCmcdCfgJsonString(buffer.str(), owner);
	if( retVal )
	{
		ConfigureLogSettings();
	}
	return retVal;
}

/**
 * @brief GetCmcdConfigJSONStr - Export every setting as json
 */
bool CmcdSettings::GetCmcdConfigJSONStr(std::string &str) const
{
	bool retVal = false;
	cJSON *item = cJSON_CreateObject();
	if( item )
	{
		{
			std::lock_guard<std::mutex> guard(mMutex);
			for( int i=0; i<CMCDCONFIG_BOOL_COUNT; i++ )
			{
				cJSON_AddBoolToObject(item, mConfigLookupTableBool[i].cmdString, configValueBool[i].value);
			}
			for( int i=0; i<CMCDCONFIG_INT_COUNT; i++ )
			{
				cJSON_AddNumberToObject(item, mConfigLookupTableInt[i].cmdString, configValueInt[i].value);
			}
			for( int i=0; i<CMCDCONFIG_FLOAT_COUNT; i++ )
			{
				cJSON_AddNumberToObject(item, mConfigLookupTableFloat[i].cmdString, configValueFloat[i].value);
			}
			for( int i=0; i<CMCDCONFIG_STRING_COUNT; i++ )
			{
				cJSON_AddStringToObject(item, mConfigLookupTableString[i].cmdString, configValueString[i].value.c_str());
			}
		}
		char *jsonStr = cJSON_PrintUnformatted(item);
		if( jsonStr )
		{
			str = jsonStr;
			cJSON_free(jsonStr);
			retVal = true;
		}
		cJSON_Delete(item);
	}
	if( !retVal )
	{
		CMCDLOG_ERR("json export failed");
	}
	return retVal;
}

/**
 * @brief RestoreConfiguration - Function is restore last configuration value from current ownership
 */
void CmcdSettings::RestoreConfiguration(ConfigPriority owner )
{
	for( int i=0; i<CMCDCONFIG_BOOL_COUNT; i++ )
	{
		RestoreConfiguration(owner, (CmcdConfigSettingBool)i);
	}
	for( int i=0; i<CMCDCONFIG_INT_COUNT; i++ )
	{
		RestoreConfiguration(owner, (CmcdConfigSettingInt)i);
	}
	for( int i=0; i<CMCDCONFIG_FLOAT_COUNT; i++ )
	{
		RestoreConfiguration(owner, (CmcdConfigSettingFloat)i);
	}
	for( int i=0; i<CMCDCONFIG_STRING_COUNT; i++ )
	{
		RestoreConfiguration(owner, (CmcdConfigSettingString)i);
	}
}

/**
 * @brief RestoreConfiguration - Function is to restore last configuration value of a particular config given configpriority matches
 */
void CmcdSettings::RestoreConfiguration(ConfigPriority owner, CmcdConfigSettingBool cfg)
{
	std::lock_guard<std::mutex> guard(mMutex);
	ConfigValueBool &setting = configValueBool[cfg];
	if(setting.owner == owner && setting.owner != setting.lastowner)
	{
		CMCDLOG_MIL("Cfg restoring [%-20s][%-5s]->[%-5s][%s]->[%s]",GetConfigName(cfg), GetConfigOwnerName(setting.owner),
			GetConfigOwnerName(setting.lastowner),setting.value?"true":"false",setting.lastvalue?"true":"false");
		setting.owner = setting.lastowner;
		setting.value = setting.lastvalue;
	}
}

void CmcdSettings::RestoreConfiguration(ConfigPriority owner, CmcdConfigSettingInt cfg)
{
	std::lock_guard<std::mutex> guard(mMutex);
	ConfigValueInt &setting = configValueInt[cfg];
	if(setting.owner == owner && setting.owner != setting.lastowner)
	{
		CMCDLOG_MIL("Cfg restoring [%-20s][%-5s]->[%-5s][%d]->[%d]",GetConfigName(cfg), GetConfigOwnerName(setting.owner),
			GetConfigOwnerName(setting.lastowner),setting.value,setting.lastvalue);
		setting.owner = setting.lastowner;
		setting.value = setting.lastvalue;
	}
}

void CmcdSettings::RestoreConfiguration(ConfigPriority owner, CmcdConfigSettingFloat cfg)
{
	std::lock_guard<std::mutex> guard(mMutex);
	ConfigValueFloat &setting = configValueFloat[cfg];
	if(setting.owner == owner && setting.owner != setting.lastowner)
	{
		CMCDLOG_MIL("Cfg restoring [%-20s][%-5s]->[%-5s][%f]->[%f]",GetConfigName(cfg), GetConfigOwnerName(setting.owner),
			GetConfigOwnerName(setting.lastowner),setting.value,setting.lastvalue);
		setting.owner = setting.lastowner;
		setting.value = setting.lastvalue;
	}
}

void CmcdSettings::RestoreConfiguration(ConfigPriority owner, CmcdConfigSettingString cfg)
{
	std::lock_guard<std::mutex> guard(mMutex);
	ConfigValueString &setting = configValueString[cfg];
	if(setting.owner == owner && setting.owner != setting.lastowner)
	{
		CMCDLOG_MIL("Cfg restoring [%-20s][%-5s]->[%-5s][%s]->[%s]",GetConfigName(cfg), GetConfigOwnerName(setting.owner),
			GetConfigOwnerName(setting.lastowner),setting.value.c_str(),setting.lastvalue.c_str());
		setting.owner = setting.lastowner;
		setting.value = setting.lastvalue;
	}
}

/**
 * @brief ConfigureLogSettings - Apply log level settings
 */
void CmcdSettings::ConfigureLogSettings()
{
	std::string logString = GetConfigValue(eCMCDConfig_LogLevel);
	CMCD_LogLevel level = eLOGLEVEL_WARN;

	if(GetConfigValue(eCMCDConfig_TraceLogging) || logString.compare("trace") == 0)
	{
		level = eLOGLEVEL_TRACE;
	}
	else if(GetConfigValue(eCMCDConfig_DebugLogging) || logString.compare("debug") == 0)
	{
		level = eLOGLEVEL_DEBUG;
	}
	else if(GetConfigValue(eCMCDConfig_InfoLogging) || logString.compare("info") == 0)
	{
		level = eLOGLEVEL_INFO;
	}
	else if(logString.empty() || !CmcdLogManager::ParseLogLevel(logString, level))
	{
		if(!logString.empty())
		{
			CMCDLOG_WARN("unknown logLevel '%s'", logString.c_str());
		}
		return;
	}
	CmcdLogManager::setLogLevel(level);
	CmcdLogManager::lockLogLevel(true);
}

/**
 * @brief ShowConfiguration - Function to list configuration values based on the owner
 */
void CmcdSettings::ShowConfiguration(ConfigPriority owner) const
{
	std::lock_guard<std::mutex> guard(mMutex);
	for( int i=0; i<CMCDCONFIG_BOOL_COUNT; i++ )
	{
		if(configValueBool[i].owner == owner || owner == CMCD_MAX_SETTING)
		{
			CMCDLOG_MIL("Cfg [%-3d][%-20s][%-5s][%s]",i,GetConfigName((CmcdConfigSettingBool)i),
				GetConfigOwnerName(configValueBool[i].owner),configValueBool[i].value?"true":"false");
		}
	}
	for( int i=0; i<CMCDCONFIG_INT_COUNT; i++ )
	{
		if(configValueInt[i].owner == owner || owner == CMCD_MAX_SETTING)
		{
			CMCDLOG_MIL("Cfg [%-3d][%-20s][%-5s][%d]",i,GetConfigName((CmcdConfigSettingInt)i),
				GetConfigOwnerName(configValueInt[i].owner),configValueInt[i].value);
		}
	}
	for( int i=0; i<CMCDCONFIG_FLOAT_COUNT; i++ )
	{
		if(configValueFloat[i].owner == owner || owner == CMCD_MAX_SETTING)
		{
			CMCDLOG_MIL("Cfg [%-3d][%-20s][%-5s][%f]",i,GetConfigName((CmcdConfigSettingFloat)i),
				GetConfigOwnerName(configValueFloat[i].owner),configValueFloat[i].value);
		}
	}
	for( int i=0; i<CMCDCONFIG_STRING_COUNT; i++ )
	{
		if(configValueString[i].owner == owner || owner == CMCD_MAX_SETTING)
		{
			CMCDLOG_MIL("Cfg [%-3d][%-20s][%-5s][%s]",i,GetConfigName((CmcdConfigSettingString)i),
				GetConfigOwnerName(configValueString[i].owner),configValueString[i].value.c_str());
		}
	}
}
