/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 25/8/2020.
//

#pragma once

#include <libpq-fe.h>

#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace ipt::postgres {

/// Placeholder of a NULL query parameter.
struct Null {};

class Result
{
public:
	explicit Result(::PGresult* result = nullptr);
	Result(Result&& r) = default;
	Result(const Result&) = delete;
	Result& operator=(Result&&) = default;
	Result& operator=(const Result&) = delete;
	~Result() = default;

	[[nodiscard]] int fields() const {return ::PQnfields(m_result.get());}
	[[nodiscard]] int tuples() const {return ::PQntuples(m_result.get());}
	[[nodiscard]] std::string_view status() const {return ::PQresStatus(::PQresultStatus(m_result.get()));}

	/// True if the command or query was executed successfully.
	[[nodiscard]] bool ok() const;

	/// SQLSTATE of a failed command, e.g. "23505" for unique violation.
	[[nodiscard]] std::string_view sqlstate() const;
	[[nodiscard]] bool unique_violation() const {return sqlstate() == "23505";}
	[[nodiscard]] bool foreign_key_violation() const {return sqlstate() == "23503";}

	/// Name of the violated constraint, if any.
	[[nodiscard]] std::string_view constraint() const;

	/// Number of rows affected by INSERT, UPDATE or DELETE.
	[[nodiscard]] std::size_t affected() const;

	[[nodiscard]] bool is_null(int row, int col) const;
	[[nodiscard]] std::string_view text(int row, int col) const;
	[[nodiscard]] std::int64_t integer(int row, int col) const;
	[[nodiscard]] double real(int row, int col) const;
	[[nodiscard]] bool boolean(int row, int col) const;
	[[nodiscard]] std::vector<unsigned char> bytea(int row, int col) const;

	/// Column number of a field name. Throws std::out_of_range if not found.
	[[nodiscard]] int column(const char *name) const;

private:
	struct DestroyResult
	{
		void operator()(::PGresult *result) const
		{
			if (result)
				::PQclear(result);
		}
	};
	std::unique_ptr<::PGresult, DestroyResult> m_result;
};

class Query
{
public:
	template <typename String, typename... Args>
	explicit Query(String&& query, const Args& ... args) : m_query{std::forward<String>(query)}
	{
		add(args...);
	}

	template <typename Function>
	auto get(Function&& func) const
	{
		std::vector<const char*> values;
		std::vector<int> sizes;
		std::vector<int> formats;

		for (auto& arg : m_args)
		{
			values.push_back(arg.is_null ? nullptr : arg.value.data());
			sizes.push_back(static_cast<int>(arg.value.size()));
			formats.push_back(arg.is_text ? 0 : 1);
		}
		return func(m_query, m_args.size(), values.data(), sizes.data(), formats.data());
	}

	[[nodiscard]] const std::string& str() const {return m_query;}

private:
	void add()
	{
	}

	template <typename FirstArg, typename ... NextArgs>
	void add(const FirstArg& first, const NextArgs& ... next)
	{
		using T = std::decay_t<FirstArg>;
		auto& arg = m_args.emplace_back();

		if constexpr (std::is_same_v<T, Null>)
		{
			arg.is_null = true;
		}
		else if constexpr (std::is_same_v<T, bool>)
		{
			arg.value = first ? "t" : "f";
		}
		else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>)
		{
			arg.value = std::to_string(first);
		}

		// special handling for const char*
		else if constexpr (std::is_same_v<T, const char*> || std::is_same_v<T, char*>)
		{
			arg.value   = first;
		}

		// for string, string_view, vector<unsigned char>, BufferView etc
		else
		{
			arg.value.assign(
				reinterpret_cast<const char*>(std::data(first)),
				std::size(first) * sizeof(*std::data(first))
			);

			// binary for anything that is not made of char, i.e. bytea
			if constexpr (!std::is_same_v<std::decay_t<decltype(*std::data(first))>, char>)
				arg.is_text = false;
		}

		add(next...);
	}

	template <typename T, typename ... NextArgs>
	void add(const std::optional<T>& first, const NextArgs& ... next)
	{
		if (first)
			add(*first, next...);
		else
			add(Null{}, next...);
	}

private:
	std::string m_query;
	struct Arg
	{
		std::string value;
		bool        is_text{true};
		bool        is_null{false};
	};
	std::vector<Arg>  m_args;
};

/// A synchronous connection to the database. Not thread-safe: use one per thread,
/// or serialize the calls.
class Session
{
public:
	explicit Session(const std::string& connection_string);
	~Session() = default;

	Session(Session&&) = default;
	Session(const Session&) = delete;
	Session& operator=(Session&&) = default;
	Session& operator=(const Session&) = delete;

	[[nodiscard]] std::string_view last_error() const;

	/// Runs a query with parameters $1, $2... taken from \a args.
	/// \param ec   Error::database_error if the query failed. The result is
	///             returned regardless, so that the caller can inspect sqlstate().
	template <typename... Args>
	Result query(const std::string& query_string, std::error_code& ec, const Args& ... args)
	{
		return exec(Query{query_string, args...}, ec);
	}

	Result exec(const Query& query, std::error_code& ec);

private:
	struct CloseConnection
	{
		void operator()(::PGconn* conn) const
		{
			::PQfinish(conn);
		}
	};
	std::unique_ptr<::PGconn, CloseConnection>  m_conn;
};

/// Rolls back unless commit() is called.
class Transaction
{
public:
	Transaction(Session& session, std::error_code& ec);
	Transaction(const Transaction&) = delete;
	Transaction& operator=(const Transaction&) = delete;
	~Transaction();

	void commit(std::error_code& ec);

private:
	Session&    m_session;
	bool        m_active{false};
};

} // end of namespace ipt::postgres
