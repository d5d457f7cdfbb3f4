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
 * @file CmcdConfigurationFactory.cpp
 * @brief Creates CmcdConfiguration instances for media items
 */

#include "CmcdConfigurationFactory.h"
#include "CmcdLogManager.h"
#include "CmcdUtils.h"

const CmcdConfigurationFactory& CmcdConfigurationFactory::GetDefault()
{
	static const DefaultCmcdConfigurationFactory defaultFactory;
	return defaultFactory;
}

CmcdConfigurationPtr DefaultCmcdConfigurationFactory::CreateCmcdConfiguration(const CmcdMediaItem &mediaItem) const
{
	std::string sessionId = cmcd_GenerateSessionId();
	std::string contentId = mediaItem.mediaId.empty() ? std::string(CMCD_DEFAULT_MEDIA_ID) : mediaItem.mediaId;
	CMCDLOG_MIL("CMCD session %s for media '%s'", sessionId.c_str(), mediaItem.mediaId.c_str());
	return std::make_shared<CmcdConfiguration>(sessionId, contentId, std::make_shared<DefaultCmcdRequestConfig>());
}
