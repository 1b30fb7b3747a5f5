/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 6/12/2021.
//

#include "MemoryCatalog.hh"

#include "util/Error.hh"

#include <algorithm>
#include <iterator>

namespace ipt {

std::vector<StorageProvider>::iterator MemoryCatalog::provider(const UserID& owner, const ObjectID& id)
{
	return std::find_if(m_providers.begin(), m_providers.end(), [&owner, &id](auto&& p)
	{
		return p.owner == owner && p.id == id;
	});
}

std::vector<ImageRecord>::iterator MemoryCatalog::image(const UserID& owner, const ObjectID& id)
{
	return std::find_if(m_images.begin(), m_images.end(), [&owner, &id](auto&& i)
	{
		return i.owner == owner && i.id == id;
	});
}

bool MemoryCatalog::name_taken(const StorageProvider& provider) const
{
	return std::any_of(m_providers.begin(), m_providers.end(), [&provider](auto&& p)
	{
		return p.owner == provider.owner && p.name == provider.name && p.id != provider.id;
	});
}

void MemoryCatalog::clear_default(const UserID& owner)
{
	for (auto&& p : m_providers)
	{
		if (p.owner == owner && p.is_default)
		{
			p.is_default = false;
			p.updated = Timestamp::now();
		}
	}
}

void MemoryCatalog::add_provider(const StorageProvider& provider, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	if (name_taken(provider))
	{
		ec = Error::duplicate_name;
		return;
	}

	if (provider.is_default)
		clear_default(provider.owner);

	m_providers.push_back(provider);
	ec.clear();
}

StorageProvider MemoryCatalog::update_provider(const StorageProvider& provider, DefaultFlag flag, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto it = this->provider(provider.owner, provider.id);
	if (it == m_providers.end())
	{
		ec = Error::provider_not_found;
		return {};
	}
	if (name_taken(provider))
	{
		ec = Error::duplicate_name;
		return {};
	}

	auto is_default = it->is_default;
	if (flag == DefaultFlag::replace)
	{
		is_default = provider.is_default;
		if (is_default)
			clear_default(provider.owner);
	}

	*it = provider;
	it->is_default = is_default;
	ec.clear();
	return *it;
}

StorageProvider MemoryCatalog::set_default(const UserID& owner, const ObjectID& id, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto it = provider(owner, id);
	if (it == m_providers.end())
	{
		ec = Error::provider_not_found;
		return {};
	}
	if (!it->is_active)
	{
		ec = Error::provider_inactive;
		return {};
	}

	if (!it->is_default)
	{
		clear_default(owner);
		it->is_default = true;
		it->updated = Timestamp::now();
	}

	ec.clear();
	return *it;
}

std::size_t MemoryCatalog::remove_provider(const UserID& owner, const ObjectID& id, ProviderDeletePolicy policy, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto it = provider(owner, id);
	if (it == m_providers.end())
	{
		ec = Error::provider_not_found;
		return 0;
	}

	auto in_use = [&owner, &id](auto&& image){return image.owner == owner && image.provider == id;};
	auto count = static_cast<std::size_t>(std::count_if(m_images.begin(), m_images.end(), in_use));
	if (count > 0 && policy == ProviderDeletePolicy::block)
	{
		ec = Error::provider_in_use;
		return 0;
	}

	for (auto&& image : m_images)
	{
		if (in_use(image))
		{
			image.provider.reset();
			image.metadata["provider_deleted"] = true;
			image.updated = Timestamp::now();
		}
	}

	m_providers.erase(it);
	ec.clear();
	return count;
}

std::optional<StorageProvider> MemoryCatalog::find_provider(const UserID& owner, const ObjectID& id, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	ec.clear();

	auto it = provider(owner, id);
	return it != m_providers.end() ? std::optional<StorageProvider>{*it} : std::nullopt;
}

std::optional<StorageProvider> MemoryCatalog::find_default(const UserID& owner, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	ec.clear();

	auto it = std::find_if(m_providers.begin(), m_providers.end(), [&owner](auto&& p)
	{
		return p.owner == owner && p.is_default;
	});
	return it != m_providers.end() ? std::optional<StorageProvider>{*it} : std::nullopt;
}

std::vector<StorageProvider> MemoryCatalog::list_providers(const UserID& owner, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	ec.clear();

	// newer providers are appended at the end
	std::vector<StorageProvider> result;
	std::copy_if(m_providers.rbegin(), m_providers.rend(), std::back_inserter(result), [&owner](auto&& p)
	{
		return p.owner == owner;
	});

	std::stable_sort(result.begin(), result.end(), [](auto&& a, auto&& b)
	{
		return a.is_default != b.is_default ? a.is_default : a.created > b.created;
	});
	return result;
}

void MemoryCatalog::add_image(const ImageRecord& image, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	if (image.provider && provider(image.owner, *image.provider) == m_providers.end())
	{
		ec = Error::provider_not_found;
		return;
	}

	m_images.push_back(image);
	ec.clear();
}

void MemoryCatalog::update_image(const ImageRecord& image, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto it = this->image(image.owner, image.id);
	if (it == m_images.end())
	{
		ec = Error::object_not_exist;
		return;
	}

	it->tags     = image.tags;
	it->metadata = image.metadata;
	it->updated  = image.updated;
	ec.clear();
}

bool MemoryCatalog::remove_image(const UserID& owner, const ObjectID& id, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	ec.clear();

	auto it = image(owner, id);
	if (it == m_images.end())
		return false;

	m_images.erase(it);
	return true;
}

std::optional<ImageRecord> MemoryCatalog::find_image(const UserID& owner, const ObjectID& id, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	ec.clear();

	auto it = image(owner, id);
	return it != m_images.end() ? std::optional<ImageRecord>{*it} : std::nullopt;
}

std::vector<ImageRecord> MemoryCatalog::list_images(const UserID& owner, const ImageQuery& query, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	ec.clear();

	std::vector<ImageRecord> matched;
	std::copy_if(m_images.rbegin(), m_images.rend(), std::back_inserter(matched), [&owner, &query](auto&& i)
	{
		return i.owner == owner && (!query.provider || i.provider == query.provider);
	});
	std::stable_sort(matched.begin(), matched.end(), [](auto&& a, auto&& b){return a.created > b.created;});

	if (query.offset >= matched.size())
		return {};

	auto first = matched.begin() + static_cast<std::ptrdiff_t>(query.offset);
	auto last  = matched.begin() + static_cast<std::ptrdiff_t>(std::min(matched.size(), query.offset + query.limit));
	return {std::make_move_iterator(first), std::make_move_iterator(last)};
}

ImageStats MemoryCatalog::image_stats(const UserID& owner, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	ec.clear();

	ImageStats stats;
	for (auto&& image : m_images)
	{
		if (image.owner != owner)
			continue;

		stats.total_images++;
		stats.total_size += image.file_size;
		if (image.is_optimized && image.optimized_size)
		{
			stats.optimized_images++;
			stats.total_saved += static_cast<std::int64_t>(image.file_size) - static_cast<std::int64_t>(*image.optimized_size);
		}
	}
	return stats;
}

} // end of namespace ipt
