/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 5/27/18.
//

#include "Timestamp.hh"

#include <boost/format.hpp>

#include <ctime>
#include <ostream>

namespace ipt {

using namespace std::chrono;

void to_json(nlohmann::json& json, const Timestamp& input)
{
	json = input.time_since_epoch().count();
}

void from_json(const nlohmann::json& json, Timestamp& output)
{
	output = Timestamp{Timestamp::duration{json.get<Timestamp::duration::rep>()}};
}

std::ostream& operator<<(std::ostream& os, Timestamp tp)
{
	return os << tp.time_since_epoch().count();
}

Timestamp Timestamp::now()
{
	return time_point_cast<Timestamp::duration>(Timestamp::clock::now());
}

std::string Timestamp::iso8601() const
{
	auto tt = std::chrono::system_clock::to_time_t(*this);
	auto ms = time_since_epoch().count() % 1000;

	std::tm tm_{};
	if (!::gmtime_r(&tt, &tm_))
		return {};

	return (boost::format{"%04d-%02d-%02dT%02d:%02d:%02d.%03dZ"}
		% (tm_.tm_year + 1900) % (tm_.tm_mon + 1) % tm_.tm_mday
		% tm_.tm_hour % tm_.tm_min % tm_.tm_sec % (ms < 0 ? ms + 1000 : ms)
	).str();
}

} // end of namespace ipt
