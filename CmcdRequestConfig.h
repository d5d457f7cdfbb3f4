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
 * @file CmcdRequestConfig.h
 * @brief Per request CMCD policy
 */

#ifndef __CMCD_REQUEST_CONFIG_H__
#define __CMCD_REQUEST_CONFIG_H__

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "CmcdDefine.h"

/**
 * @brief Custom data keyed by header name (CMCD-Object, CMCD-Request, ...).
 * Each value is a comma separated list of key=value or bare key tokens.
 */
typedef std::map<std::string, std::string> CmcdCustomData;

/**
 * @class CmcdRequestConfig
 * @brief Configuration which can vary on each request
 *
 * Implementations are shared by every in-flight request of a session. They must
 * be thread-safe and must not assume which thread calls them or in which order.
 */
class CmcdRequestConfig
{
public:
	virtual ~CmcdRequestConfig() {}

	/**
	 * @brief Checks whether the specified key is allowed in CMCD logging
	 *
	 * @param[in] key - key abbreviation, e.g. CMCD_KEY_BITRATE
	 * @return true if the key may be logged
	 */
	virtual bool IsKeyAllowed(const std::string &key) const = 0;

	/**
	 * @brief Custom data to append to each header
	 *
	 * Example:
	 *   CMCD-Request : customField1=25400
	 *   CMCD-Object  : customField2=3200,customField3=4004,customField4=v
	 *   CMCD-Status  : customField6,customField7=15000
	 *   CMCD-Session : customField8="6e2fb550-c457-11e9-bb97-0800200c9a66"
	 *
	 * A well known key listed here must not also be allowed by IsKeyAllowed(),
	 * otherwise it would be logged twice.
	 */
	virtual CmcdCustomData GetCustomData() const = 0;

	/**
	 * @brief Maximum throughput requested in kbps
	 *
	 * @param[in] throughputKbps - throughput of the audio or video object being requested
	 * @return requested maximum throughput, or CMCD_RATE_UNSET_INT if it must not be logged
	 */
	virtual int GetRequestedMaximumThroughputKbps(int throughputKbps) const = 0;
};

typedef std::shared_ptr<CmcdRequestConfig> CmcdRequestConfigPtr;

/**
 * @class DefaultCmcdRequestConfig
 * @brief Allows every key, provides no custom data and never requests a throughput
 */
class DefaultCmcdRequestConfig : public CmcdRequestConfig
{
public:
	DefaultCmcdRequestConfig() {}
	~DefaultCmcdRequestConfig() override {}

	bool IsKeyAllowed(const std::string &key) const override;
	CmcdCustomData GetCustomData() const override;
	int GetRequestedMaximumThroughputKbps(int throughputKbps) const override;
};

/**
 * @fn FindReservedKeyCollisions
 * @brief Diagnostic scan for well known keys present in custom data while also allowed
 *
 * Only reports; nothing in the configuration model rejects such a policy.
 *
 * @param[in] requestConfig - policy to inspect
 * @return colliding keys in the order found, each reported once
 */
std::vector<std::string> FindReservedKeyCollisions(const CmcdRequestConfig &requestConfig);

#endif /* __CMCD_REQUEST_CONFIG_H__ */
