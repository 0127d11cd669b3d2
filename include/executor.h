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

class LookupPipe;

/** Fetches lookup results in a child process so that a slow or failing
 * lookup service can never stall or crash the event loop. The child writes
 * the response body to a pipe which is read back through the socket engine.
 */
class CoreExport LookupExecutor final
{
public:
	/** Fetches the body of a URL.
	 * @param url The URL to fetch.
	 * @param timeout The maximum number of seconds the fetch may take.
	 * @return The response body or an empty string on error.
	 */
	typedef std::function<std::string(const std::string& url, unsigned long timeout)> Fetcher;

	/** The maximum number of lines of a response which are used. */
	static constexpr size_t MaxLines = 3;

	/** The maximum number of characters in a reply. */
	static constexpr size_t MaxLength = 300;

private:
	/** The slot holding the request which is being executed. */
	RequestSlot& slot;

	/** The networks which the reply can be delivered through. */
	LinkManager& links;

	/** The pipe from the current or most recent child process. */
	std::unique_ptr<LookupPipe> pipe;

public:
	/** The function which is run in the child process to fetch a URL. */
	Fetcher Fetch;

	LookupExecutor(RequestSlot& Slot, LinkManager& Links);
	~LookupExecutor();

	/** Starts looking up an address for the request in the slot. If the
	 * child process can not be started the request is released.
	 * @param address The address to look up.
	 */
	void Execute(const std::string& address);

	/** Delivers the lines read from the child process and releases the request.
	 * @param lines The lines which were read.
	 */
	void OnResult(const std::vector<std::string>& lines);

	/** Determines whether a child process is being read from. */
	bool IsRunning() const;

	/** Cleans up lines from the lookup service for sending to IRC.
	 * @param lines The lines to clean.
	 * @param flags The location to add RF_TRUNCATED and RF_GARBAGE to.
	 * @return The cleaned text which may be empty.
	 */
	static std::string Clean(const std::vector<std::string>& lines, unsigned int& flags);

	/** Fetches a URL with libcurl. This is the default fetcher. */
	static std::string FetchURL(const std::string& url, unsigned long timeout);
};

/** The read end of the pipe from a lookup child process. */
class CoreExport LookupPipe final
	: public EventHandler
{
private:
	/** The executor to deliver the result to. */
	LookupExecutor& executor;

	/** The data read so far. */
	std::string buffer;

	/** Whether the result has been delivered. */
	bool finished = false;

	/** Reads everything which is currently available.
	 * @return True if the child has closed the pipe or it failed; otherwise, false.
	 */
	bool Drain();

	/** Closes the pipe and delivers the result to the executor. */
	void Finish();

public:
	LookupPipe(LookupExecutor& Executor, int fd);
	~LookupPipe() override;

	/** Determines whether the result has been delivered. */
	bool IsFinished() const { return finished; }

	/** @copydoc EventHandler::OnEventHandlerRead */
	void OnEventHandlerRead() override;

	/** @copydoc EventHandler::OnEventHandlerError */
	void OnEventHandlerError(int errornum) override;
};
