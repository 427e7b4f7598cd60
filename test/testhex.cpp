#include "rudp/Hex.hpp"

#include <cassert>
#include <cstdio>

using namespace com::arena;

static void _testHexDecode(const char *hex, int expectedLength)
{
	bool expectPass = expectedLength >= 0;

	printf("Hex parse '%s' expect-%s len:%d ", hex, expectPass ? "pass" : "fail", expectedLength);

	std::vector<uint8_t> b;
	bool rv = Hex::decode(hex, b);

	printf("did-%s len:%d\n", rv ? "pass" : "fail", (int)b.size());

	assert(rv == expectPass);
	if(expectPass)
		assert((size_t)expectedLength == b.size());
	else
		assert(b.empty());

	if(rv)
		printf("  got %s\n", Hex::encode(b).c_str());
}

int main(int argc, char *argv[])
{
	uint8_t t1[] = { 0, 1, 5, 4, 0xab };
	auto t1_s = Hex::encode(t1, sizeof(t1));
	const char *t1_expected = "00010504ab";
	printf("Hex::encode expect '%s' got '%s'\n", t1_expected, t1_s.c_str());
	assert(t1_s == t1_expected);

	_testHexDecode("000102", 3);
	_testHexDecode("00fF0102", 4);
	_testHexDecode("", 0);
	_testHexDecode("00 01", -1);
	_testHexDecode("0x33", -1);
	_testHexDecode("fo", -1);
	_testHexDecode("1", -1);

	assert(0x0c == Hex::decodeDigit('C'));
	assert(-1 == Hex::decodeDigit('g'));

	Hex::dump("dump", t1, sizeof(t1));

	printf("end.\n");

	return 0;
}
