/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2020-2023 Sadie Powell <sadie@witchery.services>
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

/** Thrown when something goes wrong that the caller is expected to report.
 * The reason is a complete sentence suitable for the log.
 */
class CoreException
	: public std::exception
{
	const std::string reason;

public:
	CoreException(const std::string& message)
		: reason(message)
	{
	}

	const char* what() const noexcept override { return reason.c_str(); }

	const std::string& GetReason() const noexcept { return reason; }
};

/** Thrown while reading the config. A failed rehash leaves the running config in place. */
class CoreExport ConfigException
	: public CoreException
{
public:
	using CoreException::CoreException;
};
