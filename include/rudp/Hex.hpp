#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdint>
#include <string>
#include <vector>

namespace com { namespace arena {

class Hex {
public:
	// One line of space separated lowercase hex bytes on stdout, for -v tracing.
	static void dump(const char *msg, const void *bytes, size_t len, bool nl = true);

	static std::string encode(const void *bytes, size_t len);
	static std::string encode(const std::vector<uint8_t> &bytes);

	// Strict: an even number of hex digits, nothing else. dst is unchanged on failure.
	static bool decode(const std::string &hex, std::vector<uint8_t> &dst);

	static int decodeDigit(char d); // answer 0-15 or -1 if not a hex digit
};

} } // namespace com::arena
