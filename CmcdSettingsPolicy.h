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
 * @file CmcdSettingsPolicy.h
 * @brief CMCD policy and factory driven by CmcdSettings
 */

#ifndef __CMCD_SETTINGS_POLICY_H__
#define __CMCD_SETTINGS_POLICY_H__

#include <memory>
#include "CmcdConfigurationFactory.h"
#include "CmcdRequestConfig.h"
#include "CmcdSettings.h"

/**
 * @class CmcdSettingsRequestConfig
 * @brief Request config built from a snapshot of CmcdSettings
 *
 * Later changes to the settings are not seen by an existing instance.
 */
class CmcdSettingsRequestConfig : public CmcdRequestConfig
{
public:
	/**
	 * @brief CmcdSettingsRequestConfig constructor
	 * @param[in] settings - settings to snapshot
	 */
	explicit CmcdSettingsRequestConfig(const CmcdSettings &settings);
	~CmcdSettingsRequestConfig() override {}

	bool IsKeyAllowed(const std::string &key) const override;
	CmcdCustomData GetCustomData() const override;
	int GetRequestedMaximumThroughputKbps(int throughputKbps) const override;

private:
	bool mEnabled;
	bool mKeyAllowed[eCMCD_KEY_MAX];
	CmcdCustomData mCustomData;
	int mMaxRequestedThroughput;
	double mThroughputMultiplier;
};

/**
 * @class CmcdSettingsConfigurationFactory
 * @brief Factory taking ids and policy from CmcdSettings
 *
 * cmcdSessionId and cmcdContentId, when set, replace the generated session id
 * and the media id. Each call snapshots the settings at that moment.
 */
class CmcdSettingsConfigurationFactory : public CmcdConfigurationFactory
{
public:
	explicit CmcdSettingsConfigurationFactory(std::shared_ptr<const CmcdSettings> settings);
	~CmcdSettingsConfigurationFactory() override {}

	/**
	 * @throw CmcdInvalidArgumentException if a configured id is longer than CMCD_MAX_ID_LENGTH
	 * @throw CmcdMissingPolicyException if the factory was built without settings
	 */
	CmcdConfigurationPtr CreateCmcdConfiguration(const CmcdMediaItem &mediaItem) const override;

private:
	std::shared_ptr<const CmcdSettings> mSettings;
};

#endif /* __CMCD_SETTINGS_POLICY_H__ */
