/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2017-2018, 2021-2024 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2013-2014 Adam <Adam@anope.org>
 *   Copyright (C) 2012, 2014-2015 Attila Molnar <attilamolnar@hush.com>
 *   Copyright (C) 2009 Daniel De Graaf <danieldg@inspircd.org>
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

/** The events which an EventHandler wants to be told about. One read state
 * and one write state are active at a time, trial and blocking notes may be
 * added to either.
 */
enum EventMask
{
	/** Never report the handler as readable. */
	FD_WANT_NO_READ = 0x1,

	/** Report the handler as readable whenever new data arrives. */
	FD_WANT_FAST_READ = 0x2,

	/** All of the read states. */
	FD_WANT_READ_MASK = 0x3,

	/** Never report the handler as writable. */
	FD_WANT_NO_WRITE = 0x10,

	/** Report the handler as writable once a blocked write can continue. */
	FD_WANT_FAST_WRITE = 0x20,

	/** Writes are attempted directly and only use FD_WANT_FAST_WRITE once they block. */
	FD_WANT_EDGE_WRITE = 0x40,

	/** Report the handler as writable once and then go back to FD_WANT_NO_WRITE.
	 * Used to find out when a non-blocking connect() has finished.
	 */
	FD_WANT_SINGLE_WRITE = 0x80,

	/** All of the write states. */
	FD_WANT_WRITE_MASK = 0xF0,

	/** Try a read during the next call to DispatchTrialWrites. */
	FD_ADD_TRIAL_READ = 0x1000,

	/** The last read would have blocked. Cancels FD_ADD_TRIAL_READ. */
	FD_READ_WILL_BLOCK = 0x2000,

	/** Try a write during the next call to DispatchTrialWrites. */
	FD_ADD_TRIAL_WRITE = 0x4000,

	/** The last write would have blocked. Cancels FD_ADD_TRIAL_WRITE. */
	FD_WRITE_WILL_BLOCK = 0x8000,

	/** The trial notes. */
	FD_TRIAL_NOTE_MASK = FD_ADD_TRIAL_READ | FD_ADD_TRIAL_WRITE
};

/** Something with a file descriptor which the socket engine can watch. The
 * IRC connections and the pipes from lookup workers are both event handlers.
 */
class CoreExport EventHandler
{
private:
	/** The events which the handler currently wants. */
	int event_mask = 0;

	friend class SocketEngine;

protected:
	/** The file descriptor or -1 if there is none. */
	int fd = -1;

public:
	virtual ~EventHandler() = default;

	/** Retrieves the file descriptor. */
	inline int GetFd() const { return fd; }

	/** Determines whether the handler has a file descriptor. */
	inline bool HasFd() const { return fd >= 0; }

	/** Retrieves the events which the handler currently wants. */
	inline int GetEventMask() const { return event_mask; }

	/** Changes the file descriptor. The handler must not be in the socket engine. */
	void SetFd(int newfd) { fd = newfd; }

	/** Called when the file descriptor is readable. */
	virtual void OnEventHandlerRead() = 0;

	/** Called when the file descriptor is writable. */
	virtual void OnEventHandlerWrite() { }

	/** Called when the file descriptor has been hung up or has failed.
	 * @param errornum The error from the socket or 0 for a hang up.
	 */
	virtual void OnEventHandlerError(int errornum) { }
};

/** Watches file descriptors with poll(2) and dispatches their events. */
class CoreExport SocketEngine final
{
private:
	/** Changes the events which poll() is asked about for a handler. */
	static void OnSetEvent(EventHandler* eh, int new_mask);

public:
	/** Prepares the socket engine for use. */
	static void Init();

	/** Forgets every handler which is still registered. */
	static void Deinit();

	/** Starts watching a handler.
	 * @param eh The handler to watch. It must have a file descriptor.
	 * @param event_mask The events the handler wants.
	 * @return True if the handler was added or false if it could not be.
	 */
	static bool AddFd(EventHandler* eh, int event_mask);

	/** Changes the events a handler wants. Read and write states replace
	 * the existing state of the same kind and notes are added to it.
	 * @param eh The handler to change.
	 * @param change The new states and notes.
	 */
	static void ChangeEventMask(EventHandler* eh, int change);

	/** Stops watching a handler. The file descriptor is not closed. */
	static void DelFd(EventHandler* eh);

	/** Finds the handler which is watching a file descriptor.
	 * @return The handler or nullptr if the file descriptor is not being watched.
	 */
	static EventHandler* GetRef(int fd);

	/** Waits for events and dispatches them to their handlers.
	 * @param timeout The maximum number of milliseconds to wait.
	 * @return The number of file descriptors which had events.
	 */
	static int DispatchEvents(int timeout = 1000);

	/** Runs the trial reads and writes which have been requested since the last call. */
	static void DispatchTrialWrites();

	/** Stops watching a handler and closes its file descriptor. */
	static int Close(EventHandler* eh);

	/** Closes a file descriptor which is not being watched. */
	static int Close(int fd);

	/** Puts a file descriptor into non-blocking mode. */
	static int NonBlocking(int fd);

	/** Determines whether the last failed read or write would only have blocked. */
	static bool IgnoreError()
	{
		return errno == EAGAIN || errno == EWOULDBLOCK;
	}
};
