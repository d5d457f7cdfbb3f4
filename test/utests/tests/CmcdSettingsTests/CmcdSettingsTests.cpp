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

#include <climits>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

//include the google test dependencies
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "CmcdLogManager.h"
#include "CmcdSettingsPolicy.h"

using ::testing::IsEmpty;

// unit under test
#include <CmcdSettings.cpp>

#define ARRAY_SIZE(A) (sizeof(A)/sizeof(A[0]))

class CmcdSettingsTests : public ::testing::Test
{
protected:
	std::unique_ptr<CmcdSettings> mSettings{};

	void SetUp() override
	{
		mSettings = std::unique_ptr<CmcdSettings>(new CmcdSettings());
		CmcdLogManager::lockLogLevel(false);
		CmcdLogManager::setLogLevel(eLOGLEVEL_WARN);
	}

	void TearDown() override
	{
		mSettings = nullptr;
		CmcdLogManager::lockLogLevel(false);
		CmcdLogManager::setLogLevel(eLOGLEVEL_WARN);
	}

	std::string WriteTempFile(const std::string &name, const std::string &contents)
	{
		std::string path = ::testing::TempDir() + name;
		std::ofstream f(path, std::ofstream::out | std::ofstream::trunc);
		f << contents;
		f.close();
		return path;
	}
};

TEST_F(CmcdSettingsTests, configStringToBool)
{
	EXPECT_TRUE(ConfigLookup::ConfigStringValueToBool("True"));
	EXPECT_TRUE(ConfigLookup::ConfigStringValueToBool("1"));
	EXPECT_FALSE(ConfigLookup::ConfigStringValueToBool("false"));
	EXPECT_FALSE(ConfigLookup::ConfigStringValueToBool("0"));
	EXPECT_FALSE(ConfigLookup::ConfigStringValueToBool("2"));
	EXPECT_FALSE(ConfigLookup::ConfigStringValueToBool("maybe"));
	EXPECT_FALSE(ConfigLookup::ConfigStringValueToBool(nullptr));
}

TEST_F(CmcdSettingsTests, LookupTablesMatchEnums)
{
	for (unsigned long i = 0; i < ARRAY_SIZE(mConfigLookupTableBool); i++)
	{
		EXPECT_EQ(i, (unsigned long)mConfigLookupTableBool[i].configEnum);
	}
	for (unsigned long i = 0; i < ARRAY_SIZE(mConfigLookupTableInt); i++)
	{
		EXPECT_EQ(i, (unsigned long)mConfigLookupTableInt[i].configEnum);
	}
	for (unsigned long i = 0; i < ARRAY_SIZE(mConfigLookupTableFloat); i++)
	{
		EXPECT_EQ(i, (unsigned long)mConfigLookupTableFloat[i].configEnum);
	}
	for (unsigned long i = 0; i < ARRAY_SIZE(mConfigLookupTableString); i++)
	{
		EXPECT_EQ(i, (unsigned long)mConfigLookupTableString[i].configEnum);
	}
	for (unsigned long i = 0; i < ARRAY_SIZE(mConfigValueValidRange); i++)
	{
		EXPECT_EQ(i, (unsigned long)mConfigValueValidRange[i].type);
	}
}

TEST_F(CmcdSettingsTests, Defaults)
{
	for (int i = 0; i < CMCDCONFIG_BOOL_COUNT; i++)
	{
		CmcdConfigSettingBool cfg = (CmcdConfigSettingBool)i;
		EXPECT_EQ(mSettings->GetConfigValue(cfg), mConfigLookupTableBool[i].defaultValue);
		EXPECT_EQ(mSettings->GetConfigOwner(cfg), CMCD_DEFAULT_SETTING);
	}
	EXPECT_TRUE(mSettings->IsConfigSet(eCMCDConfig_EnableCMCD));
	EXPECT_FALSE(mSettings->IsConfigSet(eCMCDConfig_TraceLogging));
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_MaxRequestedThroughput), 0);
	EXPECT_DOUBLE_EQ(mSettings->GetConfigValue(eCMCDConfig_ThroughputMultiplier), 0.0);
	for (int i = 0; i < CMCDCONFIG_STRING_COUNT; i++)
	{
		EXPECT_EQ(mSettings->GetConfigValue((CmcdConfigSettingString)i), "");
	}
}

TEST_F(CmcdSettingsTests, ConfigNames)
{
	EXPECT_STREQ(CmcdSettings::GetConfigName(eCMCDConfig_EnableCMCD), "enableCMCD");
	EXPECT_STREQ(CmcdSettings::GetConfigName(eCMCDConfig_MaxRequestedThroughput), "cmcdMaxRequestedThroughput");
	EXPECT_STREQ(CmcdSettings::GetConfigName(eCMCDConfig_ThroughputMultiplier), "cmcdThroughputMultiplier");
	EXPECT_STREQ(CmcdSettings::GetConfigName(eCMCDConfig_CustomStatus), "cmcdCustomStatus");
	EXPECT_STREQ(CmcdSettings::GetConfigOwnerName(CMCD_APPLICATION_SETTING), "app");
	EXPECT_STREQ(CmcdSettings::GetConfigOwnerName(CMCD_MAX_SETTING), "unknown");
}

TEST_F(CmcdSettingsTests, OwnerPriority)
{
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_AllowBitrate, false);
	EXPECT_FALSE(mSettings->GetConfigValue(eCMCDConfig_AllowBitrate));
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_AllowBitrate), CMCD_APPLICATION_SETTING);

	// lower priority owner is refused
	mSettings->SetConfigValue(CMCD_OPERATOR_SETTING, eCMCDConfig_AllowBitrate, true);
	EXPECT_FALSE(mSettings->GetConfigValue(eCMCDConfig_AllowBitrate));
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_AllowBitrate), CMCD_APPLICATION_SETTING);

	mSettings->SetConfigValue(CMCD_DEV_CFG_SETTING, eCMCDConfig_AllowBitrate, true);
	EXPECT_TRUE(mSettings->GetConfigValue(eCMCDConfig_AllowBitrate));
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_AllowBitrate), CMCD_DEV_CFG_SETTING);

	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_SessionId, std::string("first"));
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_SessionId, std::string("second"));
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_SessionId), "second");
}

TEST_F(CmcdSettingsTests, RangeValidation)
{
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_MaxRequestedThroughput, -1);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_MaxRequestedThroughput), 0);
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_MaxRequestedThroughput), CMCD_DEFAULT_SETTING);

	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_MaxRequestedThroughput, 20000);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_MaxRequestedThroughput), 20000);

	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_ThroughputMultiplier, 11.0);
	EXPECT_DOUBLE_EQ(mSettings->GetConfigValue(eCMCDConfig_ThroughputMultiplier), 0.0);

	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_ThroughputMultiplier, 2.5);
	EXPECT_DOUBLE_EQ(mSettings->GetConfigValue(eCMCDConfig_ThroughputMultiplier), 2.5);
}

TEST_F(CmcdSettingsTests, RestoreConfiguration)
{
	mSettings->SetConfigValue(CMCD_OPERATOR_SETTING, eCMCDConfig_AllowContentId, false);
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_AllowContentId, true);
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_MaxRequestedThroughput, 3000);
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_ContentId, std::string("content"));
	mSettings->SetConfigValue(CMCD_DEV_CFG_SETTING, eCMCDConfig_ThroughputMultiplier, 1.5);

	mSettings->RestoreConfiguration(CMCD_APPLICATION_SETTING);

	EXPECT_FALSE(mSettings->GetConfigValue(eCMCDConfig_AllowContentId));
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_AllowContentId), CMCD_OPERATOR_SETTING);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_MaxRequestedThroughput), 0);
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_MaxRequestedThroughput), CMCD_DEFAULT_SETTING);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_ContentId), "");
	// held by another owner
	EXPECT_DOUBLE_EQ(mSettings->GetConfigValue(eCMCDConfig_ThroughputMultiplier), 1.5);
}

TEST_F(CmcdSettingsTests, RestoreSingleSetting)
{
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_CustomObject, std::string("a=1"));
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_CustomStatus, std::string("b=2"));

	mSettings->RestoreConfiguration(CMCD_OPERATOR_SETTING, eCMCDConfig_CustomObject);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_CustomObject), "a=1");

	mSettings->RestoreConfiguration(CMCD_APPLICATION_SETTING, eCMCDConfig_CustomObject);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_CustomObject), "");
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_CustomStatus), "b=2");
}

TEST_F(CmcdSettingsTests, ProcessConfigText)
{
	mSettings->ProcessConfigText("# comment line", CMCD_DEV_CFG_SETTING);
	mSettings->ProcessConfigText("enableCMCD=false", CMCD_DEV_CFG_SETTING);
	mSettings->ProcessConfigText("cmcdMaxRequestedThroughput = 5000 ", CMCD_DEV_CFG_SETTING);
	mSettings->ProcessConfigText("cmcdThroughputMultiplier=1.25", CMCD_DEV_CFG_SETTING);
	mSettings->ProcessConfigText("cmcdCustomObject=customField2=3200,customField3=4004", CMCD_DEV_CFG_SETTING);
	mSettings->ProcessConfigText("unknownSetting=1", CMCD_DEV_CFG_SETTING);
	mSettings->ProcessConfigText("", CMCD_DEV_CFG_SETTING);

	EXPECT_FALSE(mSettings->GetConfigValue(eCMCDConfig_EnableCMCD));
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_EnableCMCD), CMCD_DEV_CFG_SETTING);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_MaxRequestedThroughput), 5000);
	EXPECT_DOUBLE_EQ(mSettings->GetConfigValue(eCMCDConfig_ThroughputMultiplier), 1.25);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_CustomObject), "customField2=3200,customField3=4004");
}

TEST_F(CmcdSettingsTests, ProcessConfigTextToggle)
{
	for (int i = 0; i < CMCDCONFIG_BOOL_COUNT; i++)
	{
		CmcdConfigSettingBool cfg = mConfigLookupTableBool[i].configEnum;
		bool before = mSettings->GetConfigValue(cfg);
		mSettings->ProcessConfigText(mConfigLookupTableBool[i].cmdString, CMCD_DEV_CFG_SETTING);
		EXPECT_NE(before, mSettings->GetConfigValue(cfg));
		mSettings->ProcessConfigText(std::string(mConfigLookupTableBool[i].cmdString) + "=true", CMCD_DEV_CFG_SETTING);
		EXPECT_TRUE(mSettings->GetConfigValue(cfg));
	}
}

TEST_F(CmcdSettingsTests, ProcessConfigTextRespectsOwner)
{
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_ContentId, std::string("app"));

	mSettings->ProcessConfigText("cmcdContentId=operator", CMCD_OPERATOR_SETTING);

	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_ContentId), "app");
}

TEST_F(CmcdSettingsTests, ParseJsonString)
{
	std::string cfg = "{\"enableCMCD\":false,\"cmcdAllowSessionId\":false,\"cmcdThroughputMultiplier\":1.5,"
		"\"cmcdMaxRequestedThroughput\":\"bad\",\"cmcdSessionId\":\"abc\",\"cmcdCustomRequest\":7,\"other\":1}";

	EXPECT_TRUE(mSettings->ParseCmcdCfgJsonString(cfg, CMCD_APPLICATION_SETTING));

	EXPECT_FALSE(mSettings->GetConfigValue(eCMCDConfig_EnableCMCD));
	EXPECT_FALSE(mSettings->GetConfigValue(eCMCDConfig_AllowSessionId));
	EXPECT_DOUBLE_EQ(mSettings->GetConfigValue(eCMCDConfig_ThroughputMultiplier), 1.5);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_MaxRequestedThroughput), 0);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_SessionId), "abc");
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_CustomRequest), "");
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_SessionId), CMCD_APPLICATION_SETTING);
}

TEST_F(CmcdSettingsTests, ParseJsonStringInvalid)
{
	EXPECT_FALSE(mSettings->ParseCmcdCfgJsonString("{\"enableCMCD\":", CMCD_APPLICATION_SETTING));
	EXPECT_FALSE(mSettings->ParseCmcdCfgJsonString("[1,2]", CMCD_APPLICATION_SETTING));
	EXPECT_FALSE(mSettings->ProcessConfigJson(nullptr, CMCD_APPLICATION_SETTING));
	EXPECT_TRUE(mSettings->GetConfigValue(eCMCDConfig_EnableCMCD));
}

TEST_F(CmcdSettingsTests, ExportJson)
{
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_AllowBufferLength, false);
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_MaxRequestedThroughput, 4000);
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_CustomSession, std::string("customField8=1"));
	std::string jsonStr;

	ASSERT_TRUE(mSettings->GetCmcdConfigJSONStr(jsonStr));

	cJSON *json = cJSON_Parse(jsonStr.c_str());
	ASSERT_NE(json, nullptr);
	EXPECT_TRUE(cJSON_IsTrue(cJSON_GetObjectItem(json, "enableCMCD")));
	EXPECT_TRUE(cJSON_IsFalse(cJSON_GetObjectItem(json, "cmcdAllowBufferLength")));
	cJSON *throughput = cJSON_GetObjectItem(json, "cmcdMaxRequestedThroughput");
	ASSERT_NE(throughput, nullptr);
	EXPECT_EQ(throughput->valueint, 4000);
	cJSON *custom = cJSON_GetObjectItem(json, "cmcdCustomSession");
	ASSERT_NE(custom, nullptr);
	EXPECT_STREQ(custom->valuestring, "customField8=1");
	cJSON_Delete(json);

	// exported settings load back unchanged
	CmcdSettings copy;
	EXPECT_TRUE(copy.ParseCmcdCfgJsonString(jsonStr, CMCD_APPLICATION_SETTING));
	EXPECT_FALSE(copy.GetConfigValue(eCMCDConfig_AllowBufferLength));
	EXPECT_EQ(copy.GetConfigValue(eCMCDConfig_MaxRequestedThroughput), 4000);
	EXPECT_EQ(copy.GetConfigValue(eCMCDConfig_CustomSession), "customField8=1");
}

TEST_F(CmcdSettingsTests, ReadTxtFile)
{
	std::string path = WriteTempFile("cmcd_settings_test.cfg",
		"# cmcd settings\n"
		"cmcdAllowBitrate=false\n"
		"cmcdCustomStatus=customField6,customField7=15000\n"
		"\n"
		"cmcdMaxRequestedThroughput=2500\n");

	EXPECT_TRUE(mSettings->ReadCmcdCfgTxtFile(path));

	EXPECT_FALSE(mSettings->GetConfigValue(eCMCDConfig_AllowBitrate));
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_AllowBitrate), CMCD_DEV_CFG_SETTING);
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_CustomStatus), "customField6,customField7=15000");
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_MaxRequestedThroughput), 2500);
	std::remove(path.c_str());
}

TEST_F(CmcdSettingsTests, ReadJsonFile)
{
	std::string path = WriteTempFile("cmcd_settings_test.json",
		"{\n\t\"cmcdAllowBufferLength\": false,\n\t\"cmcdContentId\": \"json-content\"\n}\n");

	EXPECT_TRUE(mSettings->ReadCmcdCfgJsonFile(path, CMCD_OPERATOR_SETTING));

	EXPECT_FALSE(mSettings->GetConfigValue(eCMCDConfig_AllowBufferLength));
	EXPECT_EQ(mSettings->GetConfigValue(eCMCDConfig_ContentId), "json-content");
	EXPECT_EQ(mSettings->GetConfigOwner(eCMCDConfig_ContentId), CMCD_OPERATOR_SETTING);
	std::remove(path.c_str());
}

TEST_F(CmcdSettingsTests, ReadMissingFiles)
{
	std::string path = ::testing::TempDir() + "cmcd_settings_missing.cfg";
	std::remove(path.c_str());

	EXPECT_FALSE(mSettings->ReadCmcdCfgTxtFile(path));
	EXPECT_FALSE(mSettings->ReadCmcdCfgJsonFile(path));
}

TEST_F(CmcdSettingsTests, ConfigureLogSettingsFromLevelName)
{
	mSettings->SetConfigValue(CMCD_DEV_CFG_SETTING, eCMCDConfig_LogLevel, std::string("debug"));

	mSettings->ConfigureLogSettings();

	EXPECT_EQ(CmcdLogManager::cmcdLoglevel.load(), eLOGLEVEL_DEBUG);
	// level is locked against later requests
	CmcdLogManager::setLogLevel(eLOGLEVEL_ERROR);
	EXPECT_EQ(CmcdLogManager::cmcdLoglevel.load(), eLOGLEVEL_DEBUG);
}

TEST_F(CmcdSettingsTests, ConfigureLogSettingsTraceWins)
{
	mSettings->SetConfigValue(CMCD_DEV_CFG_SETTING, eCMCDConfig_TraceLogging, true);
	mSettings->SetConfigValue(CMCD_DEV_CFG_SETTING, eCMCDConfig_LogLevel, std::string("error"));

	mSettings->ConfigureLogSettings();

	EXPECT_EQ(CmcdLogManager::cmcdLoglevel.load(), eLOGLEVEL_TRACE);
}

TEST_F(CmcdSettingsTests, ConfigureLogSettingsUnknownName)
{
	mSettings->SetConfigValue(CMCD_DEV_CFG_SETTING, eCMCDConfig_LogLevel, std::string("verbose"));

	mSettings->ConfigureLogSettings();

	EXPECT_EQ(CmcdLogManager::cmcdLoglevel.load(), eLOGLEVEL_WARN);
	EXPECT_FALSE(CmcdLogManager::locked.load());
}

TEST_F(CmcdSettingsTests, ShowConfiguration)
{
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_ContentId, std::string("shown"));
	CmcdLogManager::setLogLevel(eLOGLEVEL_MIL);

	::testing::internal::CaptureStdout();
	mSettings->ShowConfiguration(CMCD_APPLICATION_SETTING);
	std::string output = ::testing::internal::GetCapturedStdout();

	EXPECT_THAT(output, ::testing::HasSubstr("cmcdContentId"));
	EXPECT_THAT(output, ::testing::HasSubstr("shown"));
	EXPECT_THAT(output, ::testing::Not(::testing::HasSubstr("enableCMCD")));
}

TEST_F(CmcdSettingsTests, RequestConfigDisabled)
{
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_EnableCMCD, false);
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_CustomObject, std::string("customField2=3200"));
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_MaxRequestedThroughput, 5000);

	CmcdSettingsRequestConfig requestConfig(*mSettings);

	for (int i = 0; i < eCMCD_KEY_MAX; i++)
	{
		EXPECT_FALSE(requestConfig.IsKeyAllowed(GetCmcdKeyName((CmcdKey)i)));
	}
	EXPECT_FALSE(requestConfig.IsKeyAllowed("customField2"));
	EXPECT_THAT(requestConfig.GetCustomData(), IsEmpty());
	EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(1000), CMCD_RATE_UNSET_INT);
}

TEST_F(CmcdSettingsTests, RequestConfigKeyFlags)
{
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_AllowBufferLength, false);
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_AllowMaxRequestedThroughput, false);

	CmcdSettingsRequestConfig requestConfig(*mSettings);

	EXPECT_TRUE(requestConfig.IsKeyAllowed(CMCD_KEY_BITRATE));
	EXPECT_FALSE(requestConfig.IsKeyAllowed(CMCD_KEY_BUFFER_LENGTH));
	EXPECT_TRUE(requestConfig.IsKeyAllowed(CMCD_KEY_CONTENT_ID));
	EXPECT_TRUE(requestConfig.IsKeyAllowed(CMCD_KEY_SESSION_ID));
	EXPECT_FALSE(requestConfig.IsKeyAllowed(CMCD_KEY_MAXIMUM_REQUESTED_BITRATE));
	EXPECT_TRUE(requestConfig.IsKeyAllowed("customField1"));
}

TEST_F(CmcdSettingsTests, RequestConfigCustomData)
{
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_CustomRequest, std::string("customField1=25400"));
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_CustomSession, std::string("   "));
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_CustomStatus, std::string("customField6,customField7=15000"));

	CmcdSettingsRequestConfig requestConfig(*mSettings);
	CmcdCustomData customData = requestConfig.GetCustomData();

	EXPECT_EQ(customData.size(), 2u);
	EXPECT_EQ(customData[CMCD_HEADER_REQUEST], "customField1=25400");
	EXPECT_EQ(customData[CMCD_HEADER_STATUS], "customField6,customField7=15000");
	EXPECT_EQ(customData.count(CMCD_HEADER_OBJECT), 0u);
	EXPECT_EQ(customData.count(CMCD_HEADER_SESSION), 0u);
}

TEST_F(CmcdSettingsTests, RequestConfigThroughput)
{
	{
		CmcdSettingsRequestConfig requestConfig(*mSettings);
		EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(1000), CMCD_RATE_UNSET_INT);
	}

	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_ThroughputMultiplier, 1.5);
	{
		CmcdSettingsRequestConfig requestConfig(*mSettings);
		EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(1000), 1500);
		EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(0), CMCD_RATE_UNSET_INT);
		EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(-5), CMCD_RATE_UNSET_INT);
	}

	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_ThroughputMultiplier, 10.0);
	{
		CmcdSettingsRequestConfig requestConfig(*mSettings);
		EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(300000000), INT_MAX);
		EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(INT_MAX), INT_MAX);
		EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(200000000), 2000000000);
	}
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_ThroughputMultiplier, 1.5);

	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_MaxRequestedThroughput, 8000);
	{
		CmcdSettingsRequestConfig requestConfig(*mSettings);
		EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(1000), 8000);
		EXPECT_EQ(requestConfig.GetRequestedMaximumThroughputKbps(0), 8000);
	}
}

TEST_F(CmcdSettingsTests, RequestConfigIsSnapshot)
{
	CmcdSettingsRequestConfig requestConfig(*mSettings);

	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_EnableCMCD, false);
	mSettings->SetConfigValue(CMCD_APPLICATION_SETTING, eCMCDConfig_CustomObject, std::string("customField2=1"));

	EXPECT_TRUE(requestConfig.IsKeyAllowed(CMCD_KEY_BITRATE));
	EXPECT_THAT(requestConfig.GetCustomData(), IsEmpty());
}
