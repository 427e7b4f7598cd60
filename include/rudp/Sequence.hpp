#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdint>

namespace com { namespace arena { namespace rudp {

// 16-bit modular sequence arithmetic. a is newer than b iff (a - b) mod 2^16
// lies in (0, 2^15).

inline int32_t seqDiff(uint16_t a, uint16_t b)
{
	return int32_t(int16_t(uint16_t(a - b)));
}

inline bool seqNewer(uint16_t a, uint16_t b)
{
	return seqDiff(a, b) > 0;
}

inline bool seqNewerOrEqual(uint16_t a, uint16_t b)
{
	return seqDiff(a, b) >= 0;
}

inline uint16_t seqAdd(uint16_t a, int32_t delta)
{
	return uint16_t(a + delta);
}

} } } // namespace com::arena::rudp
