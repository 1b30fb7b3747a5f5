/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 14/11/2021.
//

#pragma once

#include "Error.hh"
#include "Log.hh"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <type_traits>

namespace ipt {

/// Runs blocking calls to remote storage on a thread pool and waits for them
/// with a deadline. A call that misses the deadline is not cancelled: it runs to
/// completion in the pool and its result is handed to the "abandoned" handler,
/// which is responsible for cleaning up after it.
class BoundedCall
{
public:
	BoundedCall(std::size_t threads, std::chrono::milliseconds timeout) :
		m_pool{std::max<std::size_t>(threads, 1)}, m_timeout{timeout}
	{
	}
	BoundedCall(const BoundedCall&) = delete;
	BoundedCall& operator=(const BoundedCall&) = delete;
	~BoundedCall()
	{
		m_pool.join();
	}

	[[nodiscard]] std::chrono::milliseconds timeout() const {return m_timeout;}

	/// \param func         Callable with signature `Result(std::error_code&)`.
	/// \param ec           Error returned by \a func, or Error::provider_timeout.
	/// \param on_abandoned Invoked in the worker thread with the result of \a func
	///                     if the caller stopped waiting before it finished.
	template <
		typename Func,
		typename Result = std::invoke_result_t<Func, std::error_code&>,
		typename=std::enable_if_t<std::is_default_constructible_v<Result>>
	>
	Result run(
		Func&& func,
		std::error_code& ec,
		std::function<void(std::type_identity_t<Result>&&, std::error_code)> on_abandoned = {}
	)
	{
		struct State
		{
			std::mutex                  mutex;
			std::condition_variable     cond;
			bool                        done{false};
			bool                        abandoned{false};
			std::optional<Result>       result;
			std::error_code             ec;
		};
		auto state = std::make_shared<State>();

		boost::asio::post(m_pool, [state, func=std::forward<Func>(func), on_abandoned=std::move(on_abandoned)]() mutable
		{
			std::error_code ec;
			Result result{};
			try
			{
				result = func(ec);
			}
			catch (std::exception& e)
			{
				Log(LOG_WARNING, "remote storage call failed with exception: %1%", e.what());
				ec = Error::provider_connection_failed;
			}

			std::unique_lock lock{state->mutex};
			if (state->abandoned)
			{
				lock.unlock();
				if (on_abandoned)
					on_abandoned(std::move(result), ec);
			}
			else
			{
				state->result.emplace(std::move(result));
				state->ec   = ec;
				state->done = true;
				lock.unlock();
				state->cond.notify_one();
			}
		});

		std::unique_lock lock{state->mutex};
		if (!state->cond.wait_for(lock, m_timeout, [&state]{return state->done;}))
		{
			state->abandoned = true;
			ec = Error::provider_timeout;
			return Result{};
		}

		ec = state->ec;
		return std::move(*state->result);
	}

private:
	boost::asio::thread_pool    m_pool;
	std::chrono::milliseconds   m_timeout;
};

} // end of namespace ipt
