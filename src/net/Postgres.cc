/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 25/8/2020.
//

#include "Postgres.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <stdexcept>

namespace ipt::postgres {

Session::Session(const std::string& connection_string) :
	m_conn{::PQconnectdb(connection_string.c_str())}
{
	if (!m_conn)
		throw std::runtime_error("cannot connect to postgresql server");

	if (PQstatus(m_conn.get()) != CONNECTION_OK)
		throw std::runtime_error(::PQerrorMessage(m_conn.get()));
}

std::string_view Session::last_error() const
{
	return ::PQerrorMessage(m_conn.get());
}

Result Session::exec(const Query& query, std::error_code& ec)
{
	Result result{query.get(
		[this](auto&& query, std::size_t size, const char* const* values, const int* sizes, const int* formats)
		{
			return ::PQexecParams(
				m_conn.get(), query.c_str(), static_cast<int>(size), nullptr, values, sizes, formats, 0
			);
		}
	)};

	if (result.ok())
		ec.clear();
	else
	{
		// constraint violations are expected by the callers
		Log(result.unique_violation() || result.foreign_key_violation() ? LOG_INFO : LOG_WARNING, "PQexecParams() error (%1%): %2%",
			result.sqlstate(), last_error()
		);
		ec = Error::database_error;
	}
	return result;
}

Result::Result(::PGresult *result) : m_result{result}
{
}

bool Result::ok() const
{
	auto status = ::PQresultStatus(m_result.get());
	return m_result && (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);
}

std::string_view Result::sqlstate() const
{
	auto state = m_result ? ::PQresultErrorField(m_result.get(), PG_DIAG_SQLSTATE) : nullptr;
	return state ? state : "";
}

std::string_view Result::constraint() const
{
	auto name = m_result ? ::PQresultErrorField(m_result.get(), PG_DIAG_CONSTRAINT_NAME) : nullptr;
	return name ? name : "";
}

std::size_t Result::affected() const
{
	std::string_view rows = ::PQcmdTuples(m_result.get());
	return rows.empty() ? 0 : std::stoul(std::string{rows});
}

bool Result::is_null(int row, int col) const
{
	return ::PQgetisnull(m_result.get(), row, col) != 0;
}

std::string_view Result::text(int row, int col) const
{
	return {::PQgetvalue(m_result.get(), row, col), static_cast<std::size_t>(::PQgetlength(m_result.get(), row, col))};
}

std::int64_t Result::integer(int row, int col) const
{
	return is_null(row, col) ? 0 : std::stoll(std::string{text(row, col)});
}

double Result::real(int row, int col) const
{
	return is_null(row, col) ? 0.0 : std::stod(std::string{text(row, col)});
}

bool Result::boolean(int row, int col) const
{
	return text(row, col) == "t";
}

std::vector<unsigned char> Result::bytea(int row, int col) const
{
	if (is_null(row, col))
		return {};

	std::size_t size{};
	std::unique_ptr<unsigned char, decltype(&::PQfreemem)> raw{
		::PQunescapeBytea(reinterpret_cast<const unsigned char*>(::PQgetvalue(m_result.get(), row, col)), &size),
		&::PQfreemem
	};
	if (!raw)
		throw std::bad_alloc();

	return {raw.get(), raw.get() + size};
}

int Result::column(const char *name) const
{
	auto col = ::PQfnumber(m_result.get(), name);
	if (col < 0)
		throw std::out_of_range(std::string{"no such column: "} + name);
	return col;
}

Transaction::Transaction(Session& session, std::error_code& ec) : m_session{session}
{
	m_session.query("BEGIN", ec);
	m_active = !ec;
}

Transaction::~Transaction()
{
	if (m_active)
	{
		std::error_code ec;
		m_session.query("ROLLBACK", ec);
		if (ec)
			Log(LOG_WARNING, "cannot rollback transaction: %1%", m_session.last_error());
	}
}

void Transaction::commit(std::error_code& ec)
{
	m_session.query("COMMIT", ec);
	m_active = false;
}

} // end of namespace ipt::postgres
