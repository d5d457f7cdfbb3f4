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
 * @file CmcdDefine.h
 * @brief Common Media Client Data vocabulary and defines
 */

#ifndef __CMCD_DEFINE_H__
#define __CMCD_DEFINE_H__

#include <climits>
#include <string>

#define CMCD_MAX_ID_LENGTH 64                      /**< Maximum number of characters in session and content id */
#define CMCD_RATE_UNSET_INT (INT_MIN + 1)          /**< Rate value meaning "do not log" */
#define CMCD_DEFAULT_MEDIA_ID ""                   /**< Content id used when the media item has none */
#define CMCD_UUID_STRING_LENGTH 37                 /**< 36 characters plus terminator */

/* Header names, ordered by expected level of variability */
#define CMCD_HEADER_OBJECT  "CMCD-Object"          /**< keys whose values vary with the object being requested */
#define CMCD_HEADER_REQUEST "CMCD-Request"         /**< keys whose values vary with each request */
#define CMCD_HEADER_SESSION "CMCD-Session"         /**< keys invariant over the life of the session */
#define CMCD_HEADER_STATUS  "CMCD-Status"          /**< keys which do not vary with every request or object */

/* Well known keys */
#define CMCD_KEY_BITRATE                   "br"
#define CMCD_KEY_BUFFER_LENGTH             "bl"
#define CMCD_KEY_CONTENT_ID                "cid"
#define CMCD_KEY_SESSION_ID                "sid"
#define CMCD_KEY_MAXIMUM_REQUESTED_BITRATE "rtp"

/**
 * @brief CMCD header groups
 */
enum CmcdHeaderGroup
{
	eCMCD_HEADER_OBJECT,
	eCMCD_HEADER_REQUEST,
	eCMCD_HEADER_SESSION,
	eCMCD_HEADER_STATUS,
	eCMCD_HEADER_MAX
};

/**
 * @brief Well known CMCD keys handled by the configuration
 */
enum CmcdKey
{
	eCMCD_KEY_BITRATE,
	eCMCD_KEY_BUFFER_LENGTH,
	eCMCD_KEY_CONTENT_ID,
	eCMCD_KEY_SESSION_ID,
	eCMCD_KEY_MAXIMUM_REQUESTED_BITRATE,
	eCMCD_KEY_MAX
};

/**
 * @brief Config ownership values, lowest priority first
 */
typedef enum
{
	CMCD_DEFAULT_SETTING            = 0,        /**< Lowest priority */
	CMCD_OPERATOR_SETTING           = 1,
	CMCD_APPLICATION_SETTING        = 2,
	CMCD_DEV_CFG_SETTING            = 3,        /**< Highest priority */
	CMCD_MAX_SETTING
} ConfigPriority;

/**
 * @fn GetCmcdKeyName
 * @param[in] key - well known key
 * @return key abbreviation, "" for an invalid key
 */
const char *GetCmcdKeyName(CmcdKey key);

/**
 * @fn GetCmcdHeaderName
 * @param[in] group - header group
 * @return header name, "" for an invalid group
 */
const char *GetCmcdHeaderName(CmcdHeaderGroup group);

/**
 * @fn GetCmcdKeyHeaderGroup
 * @brief Header a well known key is normally carried in. Not enforced.
 */
CmcdHeaderGroup GetCmcdKeyHeaderGroup(CmcdKey key);

/**
 * @fn IsCmcdReservedKey
 * @param[in] key - key abbreviation
 * @return true if key is one of the well known keys
 */
bool IsCmcdReservedKey(const std::string &key);

#endif /* __CMCD_DEFINE_H__ */
