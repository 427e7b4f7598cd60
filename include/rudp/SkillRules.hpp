#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <istream>
#include <map>
#include <memory>
#include <string>

#include "GameMessage.hpp"

namespace com { namespace arena { namespace game {

enum SkillType { SKILL_BASIC_ATTACK = 0, SKILL_HEAL, SKILL_TELEPORT, SKILL_SHIELD, SKILL_AREA_DAMAGE,
	SKILL_BUFF, SKILL_DEBUFF, SKILL_SUMMON, SKILL_TRANSFORM, SKILL_CUSTOM };

const char *skillTypeName(SkillType type);
bool        parseSkillType(const std::string &name, SkillType &dst);

struct SkillDefinition {
	uint32_t    id { 0 };
	std::string name;
	SkillType   type { SKILL_BASIC_ATTACK };
	uint32_t    manaCost { 0 };
	uint64_t    cooldownMs { 0 };
	uint64_t    castTimeMs { 0 };
	float       range { 0 };
	bool        hasAreaOfEffect { false };
	float       areaOfEffect { 0 };
	uint32_t    baseDamage { 0 };
	uint32_t    baseHealing { 0 };
	float       levelScaling { 0 };

	// base * (1 + levelScaling * (level - 1))
	uint32_t damageAt(uint32_t level) const;
	uint32_t healingAt(uint32_t level) const;
};

// Immutable once built.
class SkillTable {
public:
	SkillTable() {}
	explicit SkillTable(const std::map<uint32_t, SkillDefinition> &skills);

	const SkillDefinition *find(uint32_t skillID) const;
	size_t size() const { return m_skills.size(); }
	const std::map<uint32_t, SkillDefinition> &getSkills() const { return m_skills; }

	// One skill per line:
	//   id|name|type|mana|cooldown_ms|cast_ms|range|aoe_or_-|damage|healing|scaling
	// with # comments and blank lines ignored. Any malformed line or duplicate
	// id fails the parse with error set and answers an empty pointer.
	static std::shared_ptr<const SkillTable> parse(std::istream &in, std::string &error);
	static std::shared_ptr<const SkillTable> load(const std::string &path, std::string &error);

	static std::shared_ptr<const SkillTable> defaults();

protected:
	std::map<uint32_t, SkillDefinition> m_skills;
};

// The current SkillTable, swapped atomically for hot reload. Dispatch takes a
// snapshot() and uses it throughout.
class SkillRuleBook {
public:
	SkillRuleBook(); // starts with SkillTable::defaults()
	explicit SkillRuleBook(std::shared_ptr<const SkillTable> table);

	std::shared_ptr<const SkillTable> snapshot() const;
	void replace(std::shared_ptr<const SkillTable> table);

	// On failure the current table stays in place.
	bool reload(const std::string &path, std::string &error);

protected:
	std::shared_ptr<const SkillTable> m_table;
};

} } } // namespace com::arena::game
