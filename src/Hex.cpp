// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdio>

#include "../include/rudp/Hex.hpp"

namespace com { namespace arena {

static const char _digits[] = "0123456789abcdef";

void Hex::dump(const char *msg, const void *bytes_, size_t len, bool nl)
{
	const uint8_t *bytes = (const uint8_t *)bytes_;

	printf("%s (%lu): ", msg, (unsigned long)len);
	for(size_t x = 0; x < len; x++)
		printf("%02x ", bytes[x]);
	if(nl)
		printf("\n");
}

std::string Hex::encode(const void *bytes_, size_t len)
{
	const uint8_t *bytes = (const uint8_t *)bytes_;
	std::string rv;

	rv.reserve(len * 2);
	for(size_t x = 0; x < len; x++)
	{
		rv.push_back(_digits[bytes[x] >> 4]);
		rv.push_back(_digits[bytes[x] & 0x0f]);
	}

	return rv;
}

std::string Hex::encode(const std::vector<uint8_t> &bytes)
{
	return encode(bytes.data(), bytes.size());
}

int Hex::decodeDigit(char d)
{
	if((d >= '0') and (d <= '9'))
		return d - '0';
	if((d >= 'a') and (d <= 'f'))
		return d - 'a' + 0x0a;
	if((d >= 'A') and (d <= 'F'))
		return d - 'A' + 0x0a;
	return -1;
}

bool Hex::decode(const std::string &hex, std::vector<uint8_t> &dst)
{
	if(hex.size() % 2)
		return false;

	std::vector<uint8_t> rv;
	rv.reserve(hex.size() / 2);
	for(size_t x = 0; x < hex.size(); x += 2)
	{
		int hi = decodeDigit(hex[x]);
		int lo = decodeDigit(hex[x + 1]);
		if((hi < 0) or (lo < 0))
			return false;
		rv.push_back(uint8_t((hi << 4) | lo));
	}

	dst.insert(dst.end(), rv.begin(), rv.end());
	return true;
}

} } // namespace com::arena
