/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2014, 2016, 2018-2021, 2024 Sadie Powell <sadie@witchery.services>
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


#pragma once

/** The version of IlineBot which is shown to users. */
#define ILINEBOT_VERSION "IlineBot-@PROJECT_VERSION@"

/** The default location that config files are stored in. */
#define ILINEBOT_CONFIG_PATH "@ILINEBOT_CONFIG_DIR@"

/** The default location that log files are stored in. */
#define ILINEBOT_LOG_PATH "@ILINEBOT_LOG_DIR@"

/** The URL which is shown to users who ask what the bot does. */
#define ILINEBOT_SERVICE "https://i-line.space"
