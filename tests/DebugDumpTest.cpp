#include "TestInterface.h"

#include <catch2/catch.hpp>

#include <string.h>

using Status = BlockHeap::Status;

namespace
{
	char const * const SingleAllocation =
		"address,size,free\n"
		"0x1000,96,false\n"
		"0x1060,100,false\n"
		"0x10c4,3900,true\n";
}

TEST_CASE("DebugDump: one row per live block in address order", "[dump]")
{
	TestHeap test;
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);
	REQUIRE(test.heap.allocate(100).succeeded());

	char buffer[256];
	int const length = test.heap.debugDump(buffer, sizeof(buffer));
	REQUIRE(length == static_cast<int>(strlen(SingleAllocation)));
	REQUIRE(std::string(buffer) == SingleAllocation);
}

TEST_CASE("DebugDump: measuring without a buffer", "[dump]")
{
	TestHeap test;
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);
	REQUIRE(test.heap.allocate(100).succeeded());

	REQUIRE(test.heap.debugDump(nullptr, 0) == static_cast<int>(strlen(SingleAllocation)));
}

TEST_CASE("DebugDump: a short buffer is truncated and terminated", "[dump]")
{
	TestHeap test;
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);
	REQUIRE(test.heap.allocate(100).succeeded());

	SECTION("inside the header")
	{
		char buffer[16];
		REQUIRE(test.heap.debugDump(buffer, sizeof(buffer)) == static_cast<int>(strlen(SingleAllocation)));
		REQUIRE(std::string(buffer) == "address,size,fr");
	}

	SECTION("inside a row")
	{
		char buffer[30];
		REQUIRE(test.heap.debugDump(buffer, sizeof(buffer)) == static_cast<int>(strlen(SingleAllocation)));
		REQUIRE(std::string(buffer) == std::string(SingleAllocation, 29));
	}

	SECTION("exactly enough room")
	{
		std::string buffer(strlen(SingleAllocation) + 1, 'x');
		REQUIRE(test.heap.debugDump(&buffer[0], static_cast<int>(buffer.size())) == static_cast<int>(strlen(SingleAllocation)));
		REQUIRE(buffer.c_str() == std::string(SingleAllocation));
	}
}

TEST_CASE("DebugDump: tombstones are not listed", "[dump]")
{
	TestHeap test;
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 8) == Status::Ok);

	BlockHeap::Allocation const a = test.heap.allocate(100);
	BlockHeap::Allocation const b = test.heap.allocate(100);
	test.heap.deallocate(a.address);
	test.heap.deallocate(b.address);
	REQUIRE(test.heap.getTombstoneCount() == 2);

	REQUIRE(test.dump() ==
		"address,size,free\n"
		"0x1000,192,false\n"
		"0x10c0,3904,true\n");
}

TEST_CASE("DebugDump: an uninitialized heap has only the header", "[dump]")
{
	TestHeap test;
	REQUIRE(test.dump() == "address,size,free\n");
}

TEST_CASE("DebugDump: sending the snapshot wraps it in the label", "[dump]")
{
	TestHeap test;
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);
	REQUIRE(test.heap.allocate(100).succeeded());

	test.heap.sendDebugDump("AFTER");
	REQUIRE(test.external.output == std::string("START-AFTER\n") + SingleAllocation + "END-AFTER\n");

	REQUIRE(test.external.locks == test.external.unlocks);
	REQUIRE(test.external.reentries == 0);
}

TEST_CASE("DebugDump: lazy heaps stop at the unmapped boundary", "[dump][carve]")
{
	TestHeap test(BlockHeap::heap_debug | BlockHeap::lazy_carving);
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);
	REQUIRE(test.dump() == "address,size,free\n0x1000,96,false\n");

	REQUIRE(test.heap.allocate(16, 64).succeeded());
	REQUIRE(test.dump() ==
		"address,size,free\n"
		"0x1000,96,false\n"
		"0x1060,48,false\n");
}
