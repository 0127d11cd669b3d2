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

class LookupExecutor;

/** Finds the address of a requester by asking the server for STATS L on
 * them and matching the reply to the request in the slot. Only one query
 * can be outstanding as only one request can be in progress.
 */
class CoreExport StatsCorrelator final
	: public Timer
{
public:
	/** The states the correlator can be in. */
	enum class State
		: uint8_t
	{
		/** No query is outstanding. */
		IDLE,

		/** A STATS L query has been sent and no reply has been matched yet. */
		AWAITING_STATS
	};

private:
	/** The slot holding the request which the query was sent for. */
	RequestSlot& slot;

	/** The executor to hand a matched address to. */
	LookupExecutor& executor;

	/** The current state. */
	State state = State::IDLE;

	/** Returns to the idle state and releases the request. */
	void Abort();

	/** Returns to the idle state without releasing the request. */
	void Stop();

	/** Handles a RPL_STATSLINKINFO reply. */
	bool OnStatsLinkInfo(Transport& link, const LookupRequest& request, const std::vector<std::string>& params);

public:
	StatsCorrelator(RequestSlot& Slot, LookupExecutor& Executor);

	/** Sends a STATS L query for the request in the slot.
	 * @param link The network to send the query on.
	 */
	void Begin(Transport& link);

	/** Offers a numeric to the correlator.
	 * @param link The network the numeric was received from.
	 * @param numeric The numeric which was received.
	 * @param params The parameters of the numeric.
	 * @return True if the numeric was consumed; otherwise, false.
	 */
	bool OnNumeric(Transport& link, unsigned int numeric, const std::vector<std::string>& params);

	/** Retrieves the current state. */
	State GetState() const { return state; }

	/** @copydoc Timer::Tick */
	bool Tick() override;
};
