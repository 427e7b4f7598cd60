#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace com { namespace arena {

using Bytes = std::vector<uint8_t>;
using Task = std::function<void(void)>;

// Intrusively reference counted base for objects that are handed out as
// std::shared_ptr via share_ref() and also referenced raw by their owners.
class Object {
public:
	Object();
	virtual ~Object();

	virtual void retain();
	virtual void release();

	static void retain(Object *obj);
	static void release(Object *obj);

	Object(const Object&) = delete;
	Object& operator= (const Object&) = delete;

	long getRefcount() const { return m_refcount; }

protected:
	std::atomic_long m_refcount;
};

template <class T> std::shared_ptr<T> share_ref(T *obj, bool retain = true)
{
	if(retain)
		Object::retain(obj);
	return std::shared_ptr<T>(obj, [] (Object *p) { Object::release(p); });
}

} } // namespace com::arena
