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
 * @file cmcdlogging.cpp
 * @brief CMCD logging mechanism source file
 */

#include <cstdarg>
#include <cstdio>
#include <strings.h>
#include <alloca.h>
#include <sys/time.h>
#include "CmcdLogManager.h"
#include "CmcdUtils.h"

static const char *mLogLevelStr[eLOGLEVEL_ERROR+1] =
{
	"TRACE", // eLOGLEVEL_TRACE
	"DEBUG", // eLOGLEVEL_DEBUG
	"INFO",  // eLOGLEVEL_INFO
	"WARN",  // eLOGLEVEL_WARN
	"MIL",   // eLOGLEVEL_MIL
	"ERROR", // eLOGLEVEL_ERROR
};

std::atomic<CMCD_LogLevel> CmcdLogManager::cmcdLoglevel{eLOGLEVEL_WARN};
std::atomic<bool> CmcdLogManager::locked{false};

const char *CmcdLogManager::getLogLevelName(CMCD_LogLevel level)
{
	if( level >= eLOGLEVEL_TRACE && level <= eLOGLEVEL_ERROR )
	{
		return mLogLevelStr[level];
	}
	return "UNKNOWN";
}

bool CmcdLogManager::ParseLogLevel(const std::string &name, CMCD_LogLevel &level)
{
	for( int i=eLOGLEVEL_TRACE; i<=eLOGLEVEL_ERROR; i++ )
	{
		if( strcasecmp(name.c_str(), mLogLevelStr[i]) == 0 )
		{
			level = (CMCD_LogLevel)i;
			return true;
		}
	}
	return false;
}

/**
 * @brief Print logs to console
 */
void logprintf(CMCD_LogLevel logLevelIndex, const char* file, int line, const char *format, ...)
{
	char timestamp[CMCD_TIMESTAMP_PREFIX_MAX_CHARS];
	struct timeval t;
	gettimeofday(&t, NULL);
	snprintf(timestamp, sizeof(timestamp), CMCD_TIMESTAMP_PREFIX_FORMAT, (unsigned int)t.tv_sec, (unsigned int)t.tv_usec / 1000 );

	char *format_ptr = NULL;
	int format_bytes = 0;
	for( int pass=0; pass<2; pass++ )
	{ // two pass: measure required bytes then populate format string
		format_bytes = snprintf(format_ptr, format_bytes,
							   "%s[CMCD][%s][%zx][%s][%d]%s\n",
							   timestamp,
							   CmcdLogManager::getLogLevelName(logLevelIndex),
							   GetPrintableThreadID(),
							   file, line,
							   format );
		if( format_bytes<=0 )
		{ // should never happen!
			break;
		}
		if( pass==0 )
		{
			format_bytes++; // include nul terminator
			format_ptr = (char *)alloca(format_bytes); // allocate on stack
		}
		else
		{
			va_list args;
			va_start(args, format);
			vprintf( format_ptr, args );
			va_end(args);
		}
	}
}
