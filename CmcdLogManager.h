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
#ifndef CMCDLOGMANAGER_H
#define CMCDLOGMANAGER_H

/**
 * @file CmcdLogManager.h
 * @brief Log manager for CMCD configuration
 */

#include <string>
#include <atomic>

/**
 * @brief Log levels of CMCD
 */
enum CMCD_LogLevel
{
	eLOGLEVEL_TRACE,    /**< Trace level */
	eLOGLEVEL_DEBUG,	/**< Debug level */
	eLOGLEVEL_INFO,     /**< Info level */
	eLOGLEVEL_WARN,     /**< Warn level */
	eLOGLEVEL_MIL,      /**< Milestone level */
	eLOGLEVEL_ERROR,    /**< Error level */
};

/**
 * @fn logprintf
 * @param[in] format - printf style string
 * @return void
 */
extern void logprintf(CMCD_LogLevel level, const char* file, int line,const char *format, ...)  __attribute__ ((format (printf, 4, 5)));

/**
 * @class CmcdLogManager
 * @brief CmcdLogManager Class
 */
class CmcdLogManager
{
public:
	static std::atomic<CMCD_LogLevel> cmcdLoglevel;
	static std::atomic<bool> locked;

	/**
	 * @fn isLogLevelAllowed
	 *
	 * @param[in] chkLevel - log level
	 * @retval true if the log level allowed for print mechanism
	 */
	static bool isLogLevelAllowed(CMCD_LogLevel chkLevel)
	{
		return (chkLevel>=cmcdLoglevel);
	}

	/**
	 * @fn setLogLevel
	 *
	 * @param[in] newLevel - log level new value
	 * @return void
	 */
	static void setLogLevel(CMCD_LogLevel newLevel)
	{
		if( !locked )
		{
			cmcdLoglevel = newLevel;
		}
	}

	/**
	 * @brief lock or unlock log level. While locked, setLogLevel calls are ignored,
	 * so a level forced through configuration survives later requests.
	 *
	 * @param lock if true, subsequent calls to setLogLevel will be ignored
	 */
	static void lockLogLevel( bool lock )
	{
		locked = lock;
	}

	/**
	 * @fn getLogLevelName
	 * @param[in] level - log level
	 * @return printable level name
	 */
	static const char *getLogLevelName(CMCD_LogLevel level);

	/**
	 * @fn ParseLogLevel
	 * @param[in] name - "trace", "debug", "info", "warn", "mil" or "error" (case insensitive)
	 * @param[out] level - parsed level
	 * @return true if name was recognized
	 */
	static bool ParseLogLevel(const std::string &name, CMCD_LogLevel &level);
};

#define CMCD_TIMESTAMP_PREFIX_MAX_CHARS 20
#define CMCD_TIMESTAMP_PREFIX_FORMAT "%u.%03u: "

/**
 * @brief convenience macro for logging framework
 *
 * @param level gives priority for the logging, which drives filtering of whether it should be presented.
 *
 * @param FORMAT is standard printf style format string followed by arguments
 */
#define CMCDLOG( LEVEL, FORMAT, ... ) \
do { \
if( (LEVEL) >= CmcdLogManager::cmcdLoglevel ) \
{ \
logprintf( LEVEL, __FUNCTION__, __LINE__, FORMAT, ##__VA_ARGS__); \
} \
} while(0)

/**
 * @brief CMCD logging defines, this can be enabled through setLogLevel() as per the need
 */
#define CMCDLOG_TRACE(FORMAT, ...) CMCDLOG(eLOGLEVEL_TRACE, FORMAT, ##__VA_ARGS__)
#define CMCDLOG_DEBUG(FORMAT, ...) CMCDLOG(eLOGLEVEL_DEBUG, FORMAT, ##__VA_ARGS__)
#define CMCDLOG_INFO(FORMAT, ...)  CMCDLOG(eLOGLEVEL_INFO, FORMAT, ##__VA_ARGS__)
#define CMCDLOG_WARN(FORMAT, ...)  CMCDLOG(eLOGLEVEL_WARN, FORMAT, ##__VA_ARGS__)
#define CMCDLOG_MIL(FORMAT, ...)   CMCDLOG(eLOGLEVEL_MIL, FORMAT, ##__VA_ARGS__)
#define CMCDLOG_ERR(FORMAT, ...)   CMCDLOG(eLOGLEVEL_ERROR, FORMAT, ##__VA_ARGS__)

#endif /* CMCDLOGMANAGER_H */
