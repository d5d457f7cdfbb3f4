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
 * @file CmcdConfigurationFactory.h
 * @brief Creates CmcdConfiguration instances for media items
 */

#ifndef __CMCD_CONFIGURATION_FACTORY_H__
#define __CMCD_CONFIGURATION_FACTORY_H__

#include <string>
#include "CmcdConfiguration.h"

/**
 * @struct CmcdMediaItem
 * @brief Identity of the media being played
 */
struct CmcdMediaItem
{
	CmcdMediaItem() : mediaId(), uri()
	{
	}
	CmcdMediaItem(const std::string &id, const std::string &url) : mediaId(id), uri(url)
	{
	}
	std::string mediaId;	/**< Application defined id, empty if not defined */
	std::string uri;		/**< Locator of the media, owned by the caller; the default factories do not read it */
};

/**
 * @class CmcdConfigurationFactory
 * @brief Factory for CmcdConfiguration instances
 *
 * Implementations must not make assumptions about which thread called their
 * methods, and must be thread-safe.
 */
class CmcdConfigurationFactory
{
public:
	virtual ~CmcdConfigurationFactory() {}

	/**
	 * @brief Creates a CmcdConfiguration for the media item
	 *
	 * @param[in] mediaItem - media from which to create the configuration
	 * @return new configuration instance
	 */
	virtual CmcdConfigurationPtr CreateCmcdConfiguration(const CmcdMediaItem &mediaItem) const = 0;

	/**
	 * @fn GetDefault
	 * @return process wide DefaultCmcdConfigurationFactory, created on first use
	 */
	static const CmcdConfigurationFactory& GetDefault();
};

/**
 * @class DefaultCmcdConfigurationFactory
 * @brief Random session id, content id from CmcdMediaItem::mediaId
 * (CMCD_DEFAULT_MEDIA_ID if empty) and a DefaultCmcdRequestConfig.
 *
 * Stateless; every call is a new session.
 */
class DefaultCmcdConfigurationFactory : public CmcdConfigurationFactory
{
public:
	DefaultCmcdConfigurationFactory() {}
	~DefaultCmcdConfigurationFactory() override {}

	CmcdConfigurationPtr CreateCmcdConfiguration(const CmcdMediaItem &mediaItem) const override;
};

#endif /* __CMCD_CONFIGURATION_FACTORY_H__ */
