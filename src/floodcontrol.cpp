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

FloodController::FloodController()
	: Timer(60, false)
{
}

bool FloodController::Admit(const LookupSettings& settings)
{
	if (!active)
	{
		active = true;
		count = 1;
		SetInterval(settings.FloodTimeout);
		BotInstance->Logs.Debug("FLOOD", "Opened a {} second flood window", settings.FloodTimeout);
		return true;
	}

	if (count >= settings.FloodCount)
	{
		BotInstance->Logs.Debug("FLOOD", "Rejected a command; {} of {} commands used", count, settings.FloodCount);
		return false;
	}

	count++;
	return true;
}

void FloodController::Refund()
{
	if (count)
		count--;
}

bool FloodController::Tick()
{
	BotInstance->Logs.Debug("FLOOD", "Flood window closed after {} commands", count);
	count = 0;
	active = false;
	return true;
}
