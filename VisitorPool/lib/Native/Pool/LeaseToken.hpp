#pragma once
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include <string>

#include "Global/pch.hpp"

// Opaque lease tokens: two random UUIDs as 64 lowercase hex characters.
class LeaseToken
{
   public:
	static constexpr std::size_t kLength = 64;

	static std::string Generate()
	{
		thread_local boost::uuids::random_generator generator;
		std::string out;
		out.reserve(kLength);
		for (int i = 0; i < 2; ++i)
		{
			const boost::uuids::uuid id = generator();
			for (const uint8_t byte : id)
			{
				out += std::format("{:02x}", byte);
			}
		}
		return out;
	}

	static bool LooksValid(std::string_view token)
	{
		if (token.size() != kLength)
			return false;
		for (const char c : token)
		{
			if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
				return false;
		}
		return true;
	}
};
