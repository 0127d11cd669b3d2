/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013-2014, 2016-2024 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2012-2014 Attila Molnar <attilamolnar@hush.com>
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

#pragma once

/** The state which is shared between a config file and the files it includes. */
struct ParseStack final
{
	/** The files which are currently being read with the innermost last. */
	std::vector<std::string> reading;

	/** The built-in entities and the variables from \<define> tags. */
	std::map<std::string, std::string, irc::insensitive_swo> vars;

	/** The tags which have been read. */
	BotConfig::TagMap& output;

	/** The errors which have been found. */
	std::stringstream& errstr;

	ParseStack(BotConfig* conf);

	/** Reads a config file and any files it includes.
	 * @param name The path to the file. Relative paths are in the config directory.
	 * @param missingokay Whether it is an error for the file to not exist.
	 * @return True if the file was read without errors; otherwise, false.
	 */
	bool ParseFile(const std::string& name, bool missingokay);

	/** Handles an \<include> tag. */
	void DoInclude(const std::shared_ptr<ConfigTag>& tag);
};
