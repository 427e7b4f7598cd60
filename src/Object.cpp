// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rudp/Object.hpp"

#if(ARENA_DEBUG_REFCOUNT)
#include <cstdio>
#endif

namespace com { namespace arena {

Object::Object() : m_refcount(1) {}

Object::~Object()
{
#if(ARENA_DEBUG_REFCOUNT)
	printf("delete %p\n", (void *)this);
#endif
}

void Object::retain()
{
	m_refcount++;
}

void Object::release()
{
#if(ARENA_DEBUG_REFCOUNT)
	printf("release %ld %p\n", m_refcount - 1, (void *)this);
#endif

	if(0 == --m_refcount)
		delete this;
}

void Object::retain(Object *obj)
{
	if(obj)
		obj->retain();
}

void Object::release(Object *obj)
{
	if(obj)
		obj->release();
}

} } // namespace com::arena
