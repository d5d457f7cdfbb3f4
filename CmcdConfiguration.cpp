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
 * @file CmcdConfiguration.cpp
 * @brief Configuration for Common Media Client Data (CMCD) logging
 */

#include "CmcdConfiguration.h"
#include "CmcdLogManager.h"

/**
 * @brief Number of characters in a UTF-8 string, continuation bytes not counted
 */
static size_t GetCharacterCount(const std::string &str)
{
	size_t count = 0;
	for(unsigned char c : str)
	{
		if((c & 0xC0) != 0x80)
		{
			count++;
		}
	}
	return count;
}

static void ValidateId(const char *name, const std::optional<std::string> &id)
{
	if(!id)
	{
		return;
	}
	size_t length = GetCharacterCount(*id);
	if(length > CMCD_MAX_ID_LENGTH)
	{
		CMCDLOG_ERR("%s length %zu exceeds %d", name, length, CMCD_MAX_ID_LENGTH);
		throw CmcdInvalidArgumentException(std::string(name) + " longer than " + std::to_string(CMCD_MAX_ID_LENGTH) + " characters");
	}
}

/**
 * @brief CmcdConfiguration - Constructor
 */
CmcdConfiguration::CmcdConfiguration(std::optional<std::string> sessionId, std::optional<std::string> contentId, CmcdRequestConfigPtr requestConfig)
	: mSessionId(std::move(sessionId)), mContentId(std::move(contentId)), mRequestConfig(std::move(requestConfig))
{
	ValidateId("sessionId", mSessionId);
	ValidateId("contentId", mContentId);
	if(!mRequestConfig)
	{
		CMCDLOG_ERR("requestConfig missing");
		throw CmcdMissingPolicyException("requestConfig must not be null");
	}
	CMCDLOG_INFO("sid:%s cid:%s", mSessionId ? mSessionId->c_str() : "<unset>", mContentId ? mContentId->c_str() : "<unset>");
}

bool CmcdConfiguration::IsKeyLoggingAllowed(CmcdKey key) const
{
	return mRequestConfig->IsKeyAllowed(GetCmcdKeyName(key));
}

bool CmcdConfiguration::IsBitrateLoggingAllowed() const
{
	return IsKeyLoggingAllowed(eCMCD_KEY_BITRATE);
}

bool CmcdConfiguration::IsBufferLengthLoggingAllowed() const
{
	return IsKeyLoggingAllowed(eCMCD_KEY_BUFFER_LENGTH);
}

bool CmcdConfiguration::IsContentIdLoggingAllowed() const
{
	return IsKeyLoggingAllowed(eCMCD_KEY_CONTENT_ID);
}

bool CmcdConfiguration::IsSessionIdLoggingAllowed() const
{
	return IsKeyLoggingAllowed(eCMCD_KEY_SESSION_ID);
}

bool CmcdConfiguration::IsMaximumRequestThroughputLoggingAllowed() const
{
	return IsKeyLoggingAllowed(eCMCD_KEY_MAXIMUM_REQUESTED_BITRATE);
}

bool CmcdConfiguration::operator==(const CmcdConfiguration &other) const
{
	return mSessionId == other.mSessionId &&
		mContentId == other.mContentId &&
		mRequestConfig == other.mRequestConfig;
}
