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
 * @file CmcdSettings.h
 * @brief Owner prioritized settings for CMCD
 */

#ifndef __CMCD_SETTINGS_H__
#define __CMCD_SETTINGS_H__

#include <mutex>
#include <string>
#include <cjson/cJSON.h>
#include "CmcdDefine.h"
#include "CmcdLogManager.h"

/// Adding a new setting:
///		a) add an enum value in CmcdConfigSettingBool, CmcdConfigSettingInt, CmcdConfigSettingFloat
///			or CmcdConfigSettingString, before the MaxValue entry
///		b) add its name and default value at the same position of the matching
///			mConfigLookupTable in CmcdSettings.cpp
///		c) read it with GetConfigValue where it is consumed

/**
 * @brief CMCD boolean settings
 */
typedef enum
{
	eCMCDConfig_EnableCMCD,							/**< Enable/Disable CMCD logging */
	eCMCDConfig_AllowBitrate,						/**< Allow br key */
	eCMCDConfig_AllowBufferLength,					/**< Allow bl key */
	eCMCDConfig_AllowContentId,						/**< Allow cid key */
	eCMCDConfig_AllowSessionId,						/**< Allow sid key */
	eCMCDConfig_AllowMaxRequestedThroughput,		/**< Allow rtp key */
	eCMCDConfig_InfoLogging,						/**< Enables Info logging */
	eCMCDConfig_DebugLogging,						/**< Enables Debug logging */
	eCMCDConfig_TraceLogging,						/**< Enables Trace logging */
	eCMCDConfig_BoolMaxValue						/**< Max value of bool config always last element */
} CmcdConfigSettingBool;
#define CMCDCONFIG_BOOL_COUNT (eCMCDConfig_BoolMaxValue)

/**
 * @brief CMCD integer settings
 */
typedef enum
{
	eCMCDConfig_MaxRequestedThroughput,				/**< Fixed rtp value in kbps, 0 if not requested */
	eCMCDConfig_IntMaxValue							/**< Max value of int config always last element */
} CmcdConfigSettingInt;
#define CMCDCONFIG_INT_COUNT (eCMCDConfig_IntMaxValue)

/**
 * @brief CMCD double settings
 */
typedef enum
{
	eCMCDConfig_ThroughputMultiplier,				/**< rtp as multiple of observed throughput, 0 if not requested */
	eCMCDConfig_FloatMaxValue						/**< Max value for float config always last element */
} CmcdConfigSettingFloat;
#define CMCDCONFIG_FLOAT_COUNT (eCMCDConfig_FloatMaxValue)

/**
 * @brief CMCD string settings
 */
typedef enum
{
	eCMCDConfig_SessionId,							/**< Session id overriding the generated one */
	eCMCDConfig_ContentId,							/**< Content id overriding the media id */
	eCMCDConfig_CustomObject,						/**< Custom data for CMCD-Object */
	eCMCDConfig_CustomRequest,						/**< Custom data for CMCD-Request */
	eCMCDConfig_CustomSession,						/**< Custom data for CMCD-Session */
	eCMCDConfig_CustomStatus,						/**< Custom data for CMCD-Status */
	eCMCDConfig_LogLevel,							/**< trace/debug/info/warn/mil/error */
	eCMCDConfig_StringMaxValue						/**< Max value for string config always last element */
} CmcdConfigSettingString;
#define CMCDCONFIG_STRING_COUNT (eCMCDConfig_StringMaxValue)

/**
 * @brief CMCD Config Boolean data type
 */
typedef struct ConfigValueBool
{
	ConfigPriority owner;
	bool value;
	ConfigPriority lastowner;
	bool lastvalue;
	ConfigValueBool():owner(CMCD_DEFAULT_SETTING),value(false),lastowner(CMCD_DEFAULT_SETTING),lastvalue(false){}
} ConfigValueBool;

/**
 * @brief CMCD Config Int data type
 */
typedef struct ConfigValueInt
{
	ConfigPriority owner;
	int value;
	ConfigPriority lastowner;
	int lastvalue;
	ConfigValueInt():owner(CMCD_DEFAULT_SETTING),value(0),lastowner(CMCD_DEFAULT_SETTING),lastvalue(0){}
} ConfigValueInt;

/**
 * @brief CMCD Config double data type
 */
typedef struct ConfigValueFloat
{
	ConfigPriority owner;
	double value;
	ConfigPriority lastowner;
	double lastvalue;
	ConfigValueFloat():owner(CMCD_DEFAULT_SETTING),value(0),lastowner(CMCD_DEFAULT_SETTING),lastvalue(0){}
} ConfigValueFloat;

/**
 * @brief CMCD Config String data type
 */
typedef struct ConfigValueString
{
	ConfigPriority owner;
	std::string value;
	ConfigPriority lastowner;
	std::string lastvalue;
	ConfigValueString():owner(CMCD_DEFAULT_SETTING),value(""),lastowner(CMCD_DEFAULT_SETTING),lastvalue(""){}
} ConfigValueString;

/**
 * @class CmcdSettings
 * @brief Settings store; a value can only be replaced by an owner of equal or higher priority
 *
 * All accessors are synchronized.
 */
class CmcdSettings
{
public:
	/**
	 * @fn CmcdSettings
	 * @brief Constructor, all settings take their default value
	 */
	CmcdSettings();
	~CmcdSettings(){};
	CmcdSettings(const CmcdSettings&) = delete;
	CmcdSettings& operator=(const CmcdSettings&) = delete;

	/**
	 * @fn SetConfigValue
	 * @param[in] owner  - ownership of new set call
	 * @param[in] cfg	- Configuration enum to set
	 * @param[in] value   - value to set
	 */
	void SetConfigValue(ConfigPriority owner, CmcdConfigSettingBool cfg , const bool &value);
	void SetConfigValue(ConfigPriority owner, CmcdConfigSettingInt cfg , const int &value);
	void SetConfigValue(ConfigPriority owner, CmcdConfigSettingFloat cfg , const double &value);
	void SetConfigValue(ConfigPriority owner, CmcdConfigSettingString cfg , const std::string &value);

	bool IsConfigSet(CmcdConfigSettingBool cfg) const;
	bool GetConfigValue( CmcdConfigSettingBool cfg ) const;
	int GetConfigValue( CmcdConfigSettingInt cfg ) const;
	double GetConfigValue( CmcdConfigSettingFloat cfg ) const;
	std::string GetConfigValue( CmcdConfigSettingString cfg ) const;

	ConfigPriority GetConfigOwner(CmcdConfigSettingBool cfg) const;
	ConfigPriority GetConfigOwner(CmcdConfigSettingInt cfg) const;
	ConfigPriority GetConfigOwner(CmcdConfigSettingFloat cfg) const;
	ConfigPriority GetConfigOwner(CmcdConfigSettingString cfg) const;

	/**
	 * @fn ProcessConfigText
	 * @param[in] cfg - one "key=value" line; "#" starts a comment, a bare bool key toggles it
	 * @param[in] owner - Owner who is setting the value
	 */
	void ProcessConfigText(const std::string &cfg, ConfigPriority owner );

	/**
	 * @fn ProcessConfigJson
	 * @param[in] cfgdata - json object of settings
	 * @param[in] owner - Owner who is setting the value
	 * @return false if cfgdata is not a json object
	 */
	bool ProcessConfigJson(const cJSON *cfgdata, ConfigPriority owner );

	/**
	 * @fn ParseCmcdCfgJsonString
	 * @param[in] cfg - settings in json format
	 * @param[in] owner - Owner who is setting the value
	 * @return false if cfg is not valid json
	 */
	bool ParseCmcdCfgJsonString(const std::string &cfg, ConfigPriority owner);

	/**
	 * @fn ReadCmcdCfgTxtFile
	 * @param[in] path - file of "key=value" lines
	 * @return false if the file could not be read
	 */
	bool ReadCmcdCfgTxtFile(const std::string &path, ConfigPriority owner = CMCD_DEV_CFG_SETTING);

	/**
	 * @fn ReadCmcdCfgJsonFile
	 * @param[in] path - json settings file
	 * @return false if the file could not be read or parsed
	 */
	bool ReadCmcdCfgJsonFile(const std::string &path, ConfigPriority owner = CMCD_DEV_CFG_SETTING);

	/**
	 * @fn GetCmcdConfigJSONStr
	 * @param[out] str - every setting as unformatted json
	 */
	bool GetCmcdConfigJSONStr(std::string &str) const;

	/**
	 * @fn RestoreConfiguration
	 * @brief Revert every setting currently held by owner to its previous value and owner
	 */
	void RestoreConfiguration(ConfigPriority owner);
	void RestoreConfiguration(ConfigPriority owner, CmcdConfigSettingBool cfg);
	void RestoreConfiguration(ConfigPriority owner, CmcdConfigSettingInt cfg);
	void RestoreConfiguration(ConfigPriority owner, CmcdConfigSettingFloat cfg);
	void RestoreConfiguration(ConfigPriority owner, CmcdConfigSettingString cfg);

	/**
	 * @fn ConfigureLogSettings
	 * @brief Apply and lock the log level selected by trace/debug/info/logLevel
	 */
	void ConfigureLogSettings();

	/**
	 * @fn ShowConfiguration
	 * @param[in] owner - list settings of this owner, CMCD_MAX_SETTING for all
	 */
	void ShowConfiguration(ConfigPriority owner) const;

	static const char * GetConfigName(CmcdConfigSettingBool cfg );
	static const char * GetConfigName(CmcdConfigSettingInt cfg );
	static const char * GetConfigName(CmcdConfigSettingFloat cfg );
	static const char * GetConfigName(CmcdConfigSettingString cfg );
	static const char * GetConfigOwnerName(ConfigPriority owner);

private:
	mutable std::mutex mMutex;
	ConfigValueBool configValueBool[CMCDCONFIG_BOOL_COUNT];
	ConfigValueInt configValueInt[CMCDCONFIG_INT_COUNT];
	ConfigValueFloat configValueFloat[CMCDCONFIG_FLOAT_COUNT];
	ConfigValueString configValueString[CMCDCONFIG_STRING_COUNT];
};

#endif /* __CMCD_SETTINGS_H__ */
