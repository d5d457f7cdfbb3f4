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
 * @file CmcdRequestConfig.cpp
 * @brief Default CMCD policy and custom data diagnostics
 */

#include <algorithm>
#include "CmcdRequestConfig.h"
#include "CmcdLogManager.h"
#include "CmcdUtils.h"

bool DefaultCmcdRequestConfig::IsKeyAllowed(const std::string &key) const
{
	return true;
}

CmcdCustomData DefaultCmcdRequestConfig::GetCustomData() const
{
	return CmcdCustomData();
}

int DefaultCmcdRequestConfig::GetRequestedMaximumThroughputKbps(int throughputKbps) const
{
	return CMCD_RATE_UNSET_INT;
}

/**
 * @brief Scan custom data for well known keys which are also allowed
 */
std::vector<std::string> FindReservedKeyCollisions(const CmcdRequestConfig &requestConfig)
{
	std::vector<std::string> collisions;
	CmcdCustomData customData = requestConfig.GetCustomData();
	for (auto it = customData.begin(); it != customData.end(); ++it)
	{
		std::vector<std::string> tokens = SplitString(it->second, ',');
		for (auto &token : tokens)
		{
			std::string key = token.substr(0, token.find('='));
			trim(key);
			if (key.empty() || !IsCmcdReservedKey(key))
			{
				continue;
			}
			if (requestConfig.IsKeyAllowed(key) &&
				std::find(collisions.begin(), collisions.end(), key) == collisions.end())
			{
				CMCDLOG_DEBUG("[%s] custom key '%s' is also allowed as a well known key", it->first.c_str(), key.c_str());
				collisions.push_back(key);
			}
		}
	}
	return collisions;
}
