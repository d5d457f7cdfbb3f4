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
 * @file CmcdConfiguration.h
 * @brief Configuration for Common Media Client Data (CMCD) logging
 */

#ifndef __CMCD_CONFIGURATION_H__
#define __CMCD_CONFIGURATION_H__

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "CmcdDefine.h"
#include "CmcdRequestConfig.h"

/**
 * @brief Session or content id longer than CMCD_MAX_ID_LENGTH
 */
class CmcdInvalidArgumentException : public std::invalid_argument
{
public:
	explicit CmcdInvalidArgumentException(const std::string &__arg) : invalid_argument(__arg) {}
};

/**
 * @brief No request config supplied
 */
class CmcdMissingPolicyException : public std::invalid_argument
{
public:
	explicit CmcdMissingPolicyException(const std::string &__arg) : invalid_argument(__arg) {}
};

/**
 * @class CmcdConfiguration
 * @brief Session and content identity plus the policy deciding what is logged
 *
 * Immutable once constructed; safe to share between request threads.
 */
class CmcdConfiguration
{
public:
	/**
	 * @brief CmcdConfiguration constructor
	 *
	 * @param[in] sessionId - GUID identifying the playback session, std::nullopt if unset
	 * @param[in] contentId - GUID identifying the content, std::nullopt if unset
	 * @param[in] requestConfig - request specific configuration
	 * @throw CmcdInvalidArgumentException if an id is longer than CMCD_MAX_ID_LENGTH
	 * @throw CmcdMissingPolicyException if requestConfig is null
	 */
	CmcdConfiguration(std::optional<std::string> sessionId, std::optional<std::string> contentId, CmcdRequestConfigPtr requestConfig);

	/**
	 * @brief A GUID identifying the current playback session
	 *
	 * Typically ties together segments belonging to a single media asset.
	 */
	const std::optional<std::string>& GetSessionId() const { return mSessionId; }

	/**
	 * @brief A GUID identifying the current content
	 *
	 * Consistent across sessions and devices, defined by the service provider.
	 */
	const std::optional<std::string>& GetContentId() const { return mContentId; }

	const CmcdRequestConfigPtr& GetRequestConfig() const { return mRequestConfig; }

	/**
	 * @fn IsKeyLoggingAllowed
	 * @param[in] key - well known key
	 * @return answer of the request config for the key abbreviation
	 */
	bool IsKeyLoggingAllowed(CmcdKey key) const;

	bool IsBitrateLoggingAllowed() const;
	bool IsBufferLengthLoggingAllowed() const;
	bool IsContentIdLoggingAllowed() const;
	bool IsSessionIdLoggingAllowed() const;
	bool IsMaximumRequestThroughputLoggingAllowed() const;

	bool operator==(const CmcdConfiguration &other) const;
	bool operator!=(const CmcdConfiguration &other) const { return !(*this == other); }

private:
	std::optional<std::string> mSessionId;
	std::optional<std::string> mContentId;
	CmcdRequestConfigPtr mRequestConfig;
};

typedef std::shared_ptr<CmcdConfiguration> CmcdConfigurationPtr;

#endif /* __CMCD_CONFIGURATION_H__ */
