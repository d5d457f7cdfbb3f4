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
 * @file CmcdUtils.cpp
 * @brief Common utility functions
 */

#include <functional>
#include <thread>
#include <sstream>
#include <uuid/uuid.h>
#include "CmcdUtils.h"
#include "CmcdDefine.h"

static std::hash<std::thread::id> std_thread_hasher;

std::size_t GetPrintableThreadID( void )
{
	return std_thread_hasher( std::this_thread::get_id() );
}

/**
 * @brief Generate a random session id
 */
std::string cmcd_GenerateSessionId( void )
{
	uuid_t uuid;
	uuid_generate_random(uuid);
	char sid[CMCD_UUID_STRING_LENGTH];
	uuid_unparse_lower(uuid, sid);
	return std::string(sid);
}

/**
 * @brief Trim a string
 */
void trim(std::string& src)
{
	size_t first = src.find_first_not_of(" \n\r\t\f\v");
	if (first != std::string::npos)
	{
		size_t last = src.find_last_not_of(" \n\r\t\f\v");
		std::string dst = src.substr(first, (last - first + 1));
		src = dst;
	}
	else
	{ // whitespace only
		src.clear();
	}
}

std::vector<std::string> SplitString(const std::string &src, char delimiter)
{
	std::vector<std::string> tokens;
	std::stringstream iss(src);
	std::string token;
	while (std::getline(iss, token, delimiter))
	{
		tokens.push_back(token);
	}
	return tokens;
}
