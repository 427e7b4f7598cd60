#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstddef>
#include <cstdint>
#include <vector>

#include "params.hpp"

namespace com { namespace arena { namespace rudp {

// Rolling bitmap over the last `size` sequence numbers behind the newest seen.
// Arrivals older than that are treated as duplicates.
class DuplicateWindow {
public:
	DuplicateWindow(size_t size = DUPLICATE_WINDOW);

	// Answers true and records sequence if it has not been seen, false if it
	// is a duplicate or too old.
	bool check(uint16_t sequence);
	bool contains(uint16_t sequence) const;

	void reset();

protected:
	std::vector<bool> m_bits;
	uint16_t m_newest;
	bool     m_any;
};

} } } // namespace com::arena::rudp
