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

#pragma once

/** Limits how many commands are accepted within a rolling window. The
 * window opens on the first admitted command and closes when the timer
 * ticks, after which the next command opens a new one.
 */
class CoreExport FloodController final
	: public Timer
{
private:
	/** The number of commands admitted in the current window. */
	unsigned long count = 0;

	/** Whether a window is currently open. */
	bool active = false;

public:
	FloodController();

	/** Attempts to admit a command.
	 * @param settings The settings which give the window length and command limit.
	 * @return True if the command was admitted; otherwise, false.
	 */
	bool Admit(const LookupSettings& settings);

	/** Returns an admission to the current window. */
	void Refund();

	/** @copydoc Timer::Tick */
	bool Tick() override;

	/** Retrieves the number of commands admitted in the current window. */
	unsigned long GetCount() const { return count; }

	/** Determines whether a window is currently open. */
	bool IsActive() const { return active; }
};
