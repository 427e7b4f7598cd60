// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

#include "../include/rudp/SkillRules.hpp"
#include "../include/rudp/Log.hpp"

namespace com { namespace arena { namespace game {

namespace {

const char * const s_skillTypeNames[] = { "BasicAttack", "Heal", "Teleport", "Shield", "AreaDamage",
	"Buff", "Debuff", "Summon", "Transform", "Custom" };

const char s_defaultSkills[] =
	"# id|name|type|mana|cooldown_ms|cast_ms|range|aoe|damage|healing|scaling\n"
	"1|Power Strike|BasicAttack|10|3000|0|5|-|25|0|0.1\n"
	"2|Heal|Heal|20|5000|500|15|-|0|40|0.1\n"
	"3|Fireball|AreaDamage|30|8000|1000|25|4|40|0|0.15\n"
	"4|Shield|Shield|15|10000|0|0|-|0|0|0\n"
	"5|Blink|Teleport|10|6000|0|20|-|0|0|0\n";

std::string trim(const std::string &s)
{
	size_t begin = s.find_first_not_of(" \t\r\n");
	if(std::string::npos == begin)
		return std::string();
	size_t end = s.find_last_not_of(" \t\r\n");
	return s.substr(begin, end - begin + 1);
}

bool parseU64(const std::string &s, uint64_t &dst)
{
	if(s.empty() or ('-' == s[0]))
		return false;
	char *endp = nullptr;
	errno = 0;
	unsigned long long v = strtoull(s.c_str(), &endp, 10);
	if(errno or *endp)
		return false;
	dst = v;
	return true;
}

bool parseU32(const std::string &s, uint32_t &dst)
{
	uint64_t v;
	if((not parseU64(s, v)) or (v > UINT32_MAX))
		return false;
	dst = uint32_t(v);
	return true;
}

bool parseNonNegativeFloat(const std::string &s, float &dst)
{
	if(s.empty())
		return false;
	char *endp = nullptr;
	errno = 0;
	double v = strtod(s.c_str(), &endp);
	if(errno or *endp or (not std::isfinite(v)) or (v < 0))
		return false;
	dst = float(v);
	return true;
}

bool parseLine(const std::string &line, SkillDefinition &skill, std::string &error)
{
	std::vector<std::string> fields;
	std::stringstream ss(line);
	std::string field;
	while(std::getline(ss, field, '|'))
		fields.push_back(trim(field));
	if((not line.empty()) and ('|' == line.back()))
		fields.push_back(std::string());

	if(11 != fields.size())
	{
		error = "expected 11 fields, found " + std::to_string(fields.size());
		return false;
	}

	if(not parseU32(fields[0], skill.id))
		error = "bad id";
	else if(fields[1].empty())
		error = "empty name";
	else if(not parseSkillType(fields[2], skill.type))
		error = "unknown skill type " + fields[2];
	else if(not parseU32(fields[3], skill.manaCost))
		error = "bad mana cost";
	else if(not parseU64(fields[4], skill.cooldownMs))
		error = "bad cooldown";
	else if(not parseU64(fields[5], skill.castTimeMs))
		error = "bad cast time";
	else if(not parseNonNegativeFloat(fields[6], skill.range))
		error = "bad range";
	else if(("-" != fields[7]) and not parseNonNegativeFloat(fields[7], skill.areaOfEffect))
		error = "bad area of effect";
	else if(not parseU32(fields[8], skill.baseDamage))
		error = "bad damage";
	else if(not parseU32(fields[9], skill.baseHealing))
		error = "bad healing";
	else if(not parseNonNegativeFloat(fields[10], skill.levelScaling))
		error = "bad level scaling";
	else
	{
		skill.name = fields[1];
		skill.hasAreaOfEffect = ("-" != fields[7]);
		if(not skill.hasAreaOfEffect)
			skill.areaOfEffect = 0;
		return true;
	}

	return false;
}

uint32_t scaled(uint32_t base, float scaling, uint32_t level)
{
	if(0 == base)
		return 0;
	double v = double(base) * (1.0 + double(scaling) * (level > 0 ? level - 1 : 0));
	if(v >= double(UINT32_MAX))
		return UINT32_MAX;
	return uint32_t(v);
}

} // anonymous namespace

const char *skillTypeName(SkillType type)
{
	if((type < SKILL_BASIC_ATTACK) or (type > SKILL_CUSTOM))
		return "Unknown";
	return s_skillTypeNames[type];
}

bool parseSkillType(const std::string &name, SkillType &dst)
{
	for(int i = SKILL_BASIC_ATTACK; i <= SKILL_CUSTOM; i++)
	{
		if(name == s_skillTypeNames[i])
		{
			dst = SkillType(i);
			return true;
		}
	}
	return false;
}

uint32_t SkillDefinition::damageAt(uint32_t level) const
{
	return scaled(baseDamage, levelScaling, level);
}

uint32_t SkillDefinition::healingAt(uint32_t level) const
{
	return scaled(baseHealing, levelScaling, level);
}

SkillTable::SkillTable(const std::map<uint32_t, SkillDefinition> &skills) :
	m_skills(skills)
{}

const SkillDefinition * SkillTable::find(uint32_t skillID) const
{
	auto it = m_skills.find(skillID);
	return it == m_skills.end() ? nullptr : &it->second;
}

std::shared_ptr<const SkillTable> SkillTable::parse(std::istream &in, std::string &error)
{
	std::map<uint32_t, SkillDefinition> skills;
	std::string line;
	size_t lineNumber = 0;

	while(std::getline(in, line))
	{
		lineNumber++;

		size_t hash = line.find('#');
		if(std::string::npos != hash)
			line.erase(hash);
		line = trim(line);
		if(line.empty())
			continue;

		SkillDefinition skill;
		std::string lineError;
		if(not parseLine(line, skill, lineError))
		{
			error = "line " + std::to_string(lineNumber) + ": " + lineError;
			return std::shared_ptr<const SkillTable>();
		}

		if(skills.count(skill.id))
		{
			error = "line " + std::to_string(lineNumber) + ": duplicate skill id " + std::to_string(skill.id);
			return std::shared_ptr<const SkillTable>();
		}

		skills[skill.id] = skill;
	}

	return std::shared_ptr<const SkillTable>(new SkillTable(skills));
}

std::shared_ptr<const SkillTable> SkillTable::load(const std::string &path, std::string &error)
{
	std::ifstream in(path);
	if(not in)
	{
		error = "can't open " + path;
		return std::shared_ptr<const SkillTable>();
	}

	auto rv = parse(in, error);
	if(not rv)
		error = path + ": " + error;
	return rv;
}

std::shared_ptr<const SkillTable> SkillTable::defaults()
{
	std::stringstream in(s_defaultSkills);
	std::string error;
	return parse(in, error);
}

SkillRuleBook::SkillRuleBook() :
	m_table(SkillTable::defaults())
{}

SkillRuleBook::SkillRuleBook(std::shared_ptr<const SkillTable> table) :
	m_table(table ? table : std::shared_ptr<const SkillTable>(new SkillTable()))
{}

std::shared_ptr<const SkillTable> SkillRuleBook::snapshot() const
{
	return std::atomic_load(&m_table);
}

void SkillRuleBook::replace(std::shared_ptr<const SkillTable> table)
{
	if(table)
		std::atomic_store(&m_table, table);
}

bool SkillRuleBook::reload(const std::string &path, std::string &error)
{
	auto table = SkillTable::load(path, error);
	if(not table)
	{
		log()->error("skill reload failed, keeping current table: {}", error);
		return false;
	}

	replace(table);
	log()->info("loaded {} skills from {}", table->size(), path);
	return true;
}

} } } // namespace com::arena::game
