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
 * @file CmcdDefine.cpp
 * @brief Lookup helpers for the CMCD vocabulary
 */

#include "CmcdDefine.h"

static const char *mCmcdKeyNames[eCMCD_KEY_MAX] =
{
	CMCD_KEY_BITRATE,                   // eCMCD_KEY_BITRATE
	CMCD_KEY_BUFFER_LENGTH,             // eCMCD_KEY_BUFFER_LENGTH
	CMCD_KEY_CONTENT_ID,                // eCMCD_KEY_CONTENT_ID
	CMCD_KEY_SESSION_ID,                // eCMCD_KEY_SESSION_ID
	CMCD_KEY_MAXIMUM_REQUESTED_BITRATE, // eCMCD_KEY_MAXIMUM_REQUESTED_BITRATE
};

static const char *mCmcdHeaderNames[eCMCD_HEADER_MAX] =
{
	CMCD_HEADER_OBJECT,  // eCMCD_HEADER_OBJECT
	CMCD_HEADER_REQUEST, // eCMCD_HEADER_REQUEST
	CMCD_HEADER_SESSION, // eCMCD_HEADER_SESSION
	CMCD_HEADER_STATUS,  // eCMCD_HEADER_STATUS
};

static const CmcdHeaderGroup mCmcdKeyHeaderGroups[eCMCD_KEY_MAX] =
{
	eCMCD_HEADER_OBJECT,  // br
	eCMCD_HEADER_REQUEST, // bl
	eCMCD_HEADER_SESSION, // cid
	eCMCD_HEADER_SESSION, // sid
	eCMCD_HEADER_STATUS,  // rtp
};

const char *GetCmcdKeyName(CmcdKey key)
{
	if(key >= eCMCD_KEY_BITRATE && key < eCMCD_KEY_MAX)
	{
		return mCmcdKeyNames[key];
	}
	return "";
}

const char *GetCmcdHeaderName(CmcdHeaderGroup group)
{
	if(group >= eCMCD_HEADER_OBJECT && group < eCMCD_HEADER_MAX)
	{
		return mCmcdHeaderNames[group];
	}
	return "";
}

CmcdHeaderGroup GetCmcdKeyHeaderGroup(CmcdKey key)
{
	if(key >= eCMCD_KEY_BITRATE && key < eCMCD_KEY_MAX)
	{
		return mCmcdKeyHeaderGroups[key];
	}
	return eCMCD_HEADER_MAX;
}

bool IsCmcdReservedKey(const std::string &key)
{
	for(int i = 0; i < eCMCD_KEY_MAX; i++)
	{
		if(key == mCmcdKeyNames[i])
		{
			return true;
		}
	}
	return false;
}
