//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of soapclient::context, used to cancel a round trip or to
/// limit the time it may take

#include <soapclient/config.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace soapclient
{

/// \brief A context is shared between the caller of a round trip and the
/// transport executing it.
///
/// Calling cancel(), possibly from another thread, makes the transport
/// abort the exchange in progress. The same happens when the deadline
/// passes. A context that is done stays done. A context derived from a
/// parent context is also done when its parent is.

class context
{
  public:
	using clock_type = std::chrono::steady_clock;
	using time_point = clock_type::time_point;

	context() = default;

	/// \brief a context that expires at \a deadline
	explicit context(time_point deadline)
		: m_deadline(deadline) {}

	/// \brief a context that expires at \a deadline or when \a parent is done
	context(std::shared_ptr<const context> parent, time_point deadline)
		: m_parent(std::move(parent)), m_deadline(deadline) {}

	context(const context&) = delete;
	context& operator=(const context&) = delete;

	/// \brief create a context that expires \a timeout from now
	template<typename Rep, typename Period>
	static std::shared_ptr<context> with_timeout(std::chrono::duration<Rep,Period> timeout)
	{
		return std::make_shared<context>(clock_type::now() + std::chrono::duration_cast<clock_type::duration>(timeout));
	}

	/// \brief create a context that expires \a timeout from now or when \a parent is done
	template<typename Rep, typename Period>
	static std::shared_ptr<context> with_timeout(std::shared_ptr<const context> parent, std::chrono::duration<Rep,Period> timeout)
	{
		return std::make_shared<context>(std::move(parent), clock_type::now() + std::chrono::duration_cast<clock_type::duration>(timeout));
	}

	void cancel() const										{ m_cancelled = true; }

	bool cancelled() const
	{
		return m_cancelled or (m_parent and m_parent->cancelled());
	}

	const std::optional<time_point>& get_deadline() const	{ return m_deadline; }

	bool deadline_exceeded() const
	{
		return (m_deadline.has_value() and clock_type::now() >= *m_deadline) or
			(m_parent and m_parent->deadline_exceeded());
	}

	/// \brief true when the context was cancelled or its deadline passed
	bool done() const										{ return cancelled() or deadline_exceeded(); }

	/// \brief the reason this context is done, empty if it is not
	std::string reason() const
	{
		std::string result;
		if (cancelled())
			result = "context canceled";
		else if (deadline_exceeded())
			result = "context deadline exceeded";
		return result;
	}

  private:
	std::shared_ptr<const context> m_parent;
	mutable std::atomic<bool> m_cancelled{ false };
	std::optional<time_point> m_deadline;
};

} // namespace soapclient
