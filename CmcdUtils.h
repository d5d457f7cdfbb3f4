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
 * @file CmcdUtils.h
 * @brief Context-free common utility functions.
 */

#ifndef __CMCD_UTILS_H__
#define __CMCD_UTILS_H__

#include <cstddef>
#include <string>
#include <vector>

/**
 * @fn GetPrintableThreadID
 * @return hash of the calling thread id, used as log prefix
 */
std::size_t GetPrintableThreadID( void );

/**
 * @fn cmcd_GenerateSessionId
 * @brief Generate a random lower case UUID string (36 characters)
 */
std::string cmcd_GenerateSessionId( void );

/**
 * @fn trim
 * @param[in][out] src Buffer containing string
 */
void trim(std::string& src);

/**
 * @fn SplitString
 * @param[in] src - string to split
 * @param[in] delimiter - separator character
 * @return tokens, including empty ones
 */
std::vector<std::string> SplitString(const std::string &src, char delimiter);

#endif /* __CMCD_UTILS_H__ */
