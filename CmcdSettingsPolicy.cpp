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
 * @file CmcdSettingsPolicy.cpp
 * @brief CMCD policy and factory driven by CmcdSettings
 */

#include <climits>
#include "CmcdSettingsPolicy.h"
#include "CmcdLogManager.h"
#include "CmcdUtils.h"

/**
 * @brief allow flag setting for each well known key, indexed by CmcdKey
 */
static const CmcdConfigSettingBool mKeyAllowSetting[eCMCD_KEY_MAX] =
{
	eCMCDConfig_AllowBitrate,
	eCMCDConfig_AllowBufferLength,
	eCMCDConfig_AllowContentId,
	eCMCDConfig_AllowSessionId,
	eCMCDConfig_AllowMaxRequestedThroughput
};

/**
 * @brief custom data setting for each header, indexed by CmcdHeaderGroup
 */
static const CmcdConfigSettingString mHeaderCustomSetting[eCMCD_HEADER_MAX] =
{
	eCMCDConfig_CustomObject,
	eCMCDConfig_CustomRequest,
	eCMCDConfig_CustomSession,
	eCMCDConfig_CustomStatus
};

CmcdSettingsRequestConfig::CmcdSettingsRequestConfig(const CmcdSettings &settings)
	: mEnabled(settings.GetConfigValue(eCMCDConfig_EnableCMCD)), mKeyAllowed(), mCustomData(),
	mMaxRequestedThroughput(settings.GetConfigValue(eCMCDConfig_MaxRequestedThroughput)),
	mThroughputMultiplier(settings.GetConfigValue(eCMCDConfig_ThroughputMultiplier))
{
	for( int i=0; i<eCMCD_KEY_MAX; i++ )
	{
		mKeyAllowed[i] = mEnabled && settings.GetConfigValue(mKeyAllowSetting[i]);
	}
	if( mEnabled )
	{
		for( int i=0; i<eCMCD_HEADER_MAX; i++ )
		{
			std::string value = settings.GetConfigValue(mHeaderCustomSetting[i]);
			trim(value);
			if( !value.empty() )
			{
				mCustomData[GetCmcdHeaderName((CmcdHeaderGroup)i)] = value;
			}
		}
	}
	CMCDLOG_DEBUG("enabled:%d custom headers:%zu rtp:%d multiplier:%f", mEnabled, mCustomData.size(), mMaxRequestedThroughput, mThroughputMultiplier);
}

bool CmcdSettingsRequestConfig::IsKeyAllowed(const std::string &key) const
{
	if( !mEnabled )
	{
		return false;
	}
	for( int i=0; i<eCMCD_KEY_MAX; i++ )
	{
		if( key == GetCmcdKeyName((CmcdKey)i) )
		{
			return mKeyAllowed[i];
		}
	}
	return true;
}

CmcdCustomData CmcdSettingsRequestConfig::GetCustomData() const
{
	return mCustomData;
}

int CmcdSettingsRequestConfig::GetRequestedMaximumThroughputKbps(int throughputKbps) const
{
	int ret = CMCD_RATE_UNSET_INT;
	if( mEnabled )
	{
		if( mMaxRequestedThroughput > 0 )
		{
			ret = mMaxRequestedThroughput;
		}
		else if( mThroughputMultiplier > 0 && throughputKbps > 0 )
		{
			double scaled = throughputKbps * mThroughputMultiplier;
			ret = (scaled >= (double)INT_MAX) ? INT_MAX : (int)scaled;
		}
	}
	return ret;
}

CmcdSettingsConfigurationFactory::CmcdSettingsConfigurationFactory(std::shared_ptr<const CmcdSettings> settings)
	: mSettings(std::move(settings))
{
}

CmcdConfigurationPtr CmcdSettingsConfigurationFactory::CreateCmcdConfiguration(const CmcdMediaItem &mediaItem) const
{
	if( !mSettings )
	{
		CMCDLOG_ERR("settings missing");
		throw CmcdMissingPolicyException("settings must not be null");
	}
	std::string sessionId = mSettings->GetConfigValue(eCMCDConfig_SessionId);
	if( sessionId.empty() )
	{
		sessionId = cmcd_GenerateSessionId();
	}
	std::string contentId = mSettings->GetConfigValue(eCMCDConfig_ContentId);
	if( contentId.empty() )
	{
		contentId = mediaItem.mediaId.empty() ? std::string(CMCD_DEFAULT_MEDIA_ID) : mediaItem.mediaId;
	}
	auto requestConfig = std::make_shared<CmcdSettingsRequestConfig>(*mSettings);
	for( const auto &key : FindReservedKeyCollisions(*requestConfig) )
	{
		CMCDLOG_WARN("custom data repeats allowed key '%s'", key.c_str());
	}
	CMCDLOG_MIL("CMCD session %s for media '%s'", sessionId.c_str(), mediaItem.mediaId.c_str());
	return std::make_shared<CmcdConfiguration>(sessionId, contentId, requestConfig);
}
