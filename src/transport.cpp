/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *
 * This file is part of IlineBot.  IlineBot is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General Public
 * License as published by the Free Software Foundation, version 2.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ilinebot.h"

bool LinkManager::Add(Transport* link)
{
	if (!links.emplace(link->GetTag(), link).second)
		return false;

	BotInstance->Logs.Debug("LINK", "Registered the {} network", link->GetTag());
	return true;
}

void LinkManager::Del(Transport* link)
{
	auto it = links.find(link->GetTag());
	if (it == links.end() || it->second != link)
		return;

	links.erase(it);
	BotInstance->Logs.Debug("LINK", "Unregistered the {} network", link->GetTag());
}

Transport* LinkManager::Find(const std::string& tag) const
{
	auto it = links.find(tag);
	return it == links.end() ? nullptr : it->second;
}
