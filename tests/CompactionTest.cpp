#include "TestInterface.h"

#include <catch2/catch.hpp>

using Status = BlockHeap::Status;

namespace
{
	// Six 100 byte allocations after the table fill a table of 8 slots with
	// the trailing free block. Freeing the second and third leaves a tombstone.
	void FillAndFragment(TestHeap & test, BlockAddress (&addresses)[6])
	{
		REQUIRE(test.heap.initialize(0x1000, 0x11000, 8) == Status::Ok);
		for (BlockAddress & address : addresses)
		{
			BlockHeap::Allocation const allocation = test.heap.allocate(100);
			REQUIRE(allocation.succeeded());
			address = allocation.address;
		}
		REQUIRE(test.heap.getCount() == 8);

		test.heap.deallocate(addresses[1]);
		test.heap.deallocate(addresses[2]);
		REQUIRE(test.heap.getTombstoneCount() == 1);
		REQUIRE(test.heap.allocationBalance() == 4);
	}
}

TEST_CASE("Compaction: a full table is compacted and the allocation retried", "[compact]")
{
	TestHeap test;
	BlockAddress addresses[6];
	FillAndFragment(test, addresses);

	BlockHeap::Allocation const allocation = test.heap.allocate(1000);
	REQUIRE(allocation.succeeded());
	REQUIRE(allocation.address == 0x1000 + TableSize(8) + 600);

	REQUIRE(test.heap.getNumberOfCompactions() == 1);
	REQUIRE(test.external.compactions.size() == 1);
	REQUIRE(test.external.compactions.front().first == 0);
	REQUIRE(test.external.compactions.front().second == 1);

	REQUIRE(test.heap.allocationBalance() == 5);
	REQUIRE(test.heap.getTombstoneCount() == 0);
	REQUIRE(test.heap.getCount() == 8);
	REQUIRE(test.external.errors.empty());
}

TEST_CASE("Compaction: used blocks never move", "[compact]")
{
	TestHeap test;
	BlockAddress addresses[6];
	FillAndFragment(test, addresses);

	std::string const before = test.dump();
	REQUIRE(test.heap.compact() == 1);

	REQUIRE(test.dump() == before);
	REQUIRE(test.heap.getCount() == 7);
	REQUIRE(test.heap.allocationBalance() == 4);

	for (int i : { 0, 3, 4, 5 })
	{
		REQUIRE(test.heap.isAllocated(addresses[i]));
		REQUIRE(test.heap.getAllocationSize(addresses[i]) == 100);
	}

	Block block;
	REQUIRE(test.heap.findBlock(addresses[2], block));
	REQUIRE(block.address == addresses[1]);
	REQUIRE(block.size == 200);
	REQUIRE(block.is_free);
}

TEST_CASE("Compaction: a second compaction finds nothing to do", "[compact]")
{
	TestHeap test;
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);

	BlockHeap::Allocation const allocation = test.heap.allocate(100);
	test.heap.deallocate(allocation.address);

	REQUIRE(test.heap.compact() == 1);
	REQUIRE(test.heap.compact() == 0);
	REQUIRE(test.heap.getNumberOfCompactions() == 2);
	REQUIRE(test.heap.getCount() == 2);
}

TEST_CASE("Compaction: metadata exhaustion when compaction reclaims nothing", "[compact][exhausted]")
{
	SECTION("reported as a status")
	{
		TestHeap test;
		REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);
		REQUIRE(test.heap.allocate(100).address == 0x1060);
		REQUIRE(test.heap.allocate(50).address == 0x10c4);

		REQUIRE(test.heap.allocate(10).status == Status::MetadataExhausted);
		REQUIRE(test.heap.getNumberOfCompactions() == 1);
		REQUIRE(test.heap.allocationBalance() == 2);
		REQUIRE(test.external.errors.empty());

		// The table is unchanged, the free block can still be handed out whole
		BlockHeap::Allocation const whole = test.heap.allocate(3000);
		REQUIRE(whole.succeeded());
		REQUIRE(test.heap.getAllocationSize(whole.address) == 3850);
	}

	SECTION("fatal for the kernel heap")
	{
		TestHeap test(BlockHeap::heap_debug | BlockHeap::heap_kernel);
		REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);
		test.heap.allocate(100);
		test.heap.allocate(50);

		REQUIRE(test.heap.allocate(10).status == Status::MetadataExhausted);
		REQUIRE(test.external.errors.size() == 1);
		REQUIRE(test.external.errors.front() == BlockHeap::ErrorInfo::Type::MetadataExhausted);
		REQUIRE(test.external.terminations == 1);
	}
}

TEST_CASE("Compaction: carving a new block also compacts when the table is full", "[compact][carve]")
{
	TestHeap test(BlockHeap::heap_debug | BlockHeap::lazy_carving);
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);

	BlockHeap::Allocation const a = test.heap.allocate(100);
	BlockHeap::Allocation const b = test.heap.allocate(100);
	BlockHeap::Allocation const c = test.heap.allocate(100);
	REQUIRE(c.succeeded());
	REQUIRE(test.heap.getCount() == 4);

	test.heap.deallocate(a.address);
	test.heap.deallocate(b.address);
	REQUIRE(test.heap.getTombstoneCount() == 1);

	BlockHeap::Allocation const d = test.heap.allocate(500);
	REQUIRE(d.succeeded());
	REQUIRE(d.address == c.address + 100);
	REQUIRE(test.heap.getNumberOfCompactions() == 1);
	REQUIRE(test.heap.getTombstoneCount() == 0);
	REQUIRE(test.external.errors.empty());
}

TEST_CASE("Compaction: snapshots around the compaction", "[compact][dump]")
{
	TestHeap test(BlockHeap::heap_debug | BlockHeap::dump_compaction);
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);

	BlockHeap::Allocation const allocation = test.heap.allocate(100);
	test.heap.deallocate(allocation.address);
	REQUIRE(test.external.output.empty());

	REQUIRE(test.heap.compact() == 1);

	std::string const rows =
		"address,size,free\n"
		"0x1000,96,false\n"
		"0x1060,4000,true\n";
	REQUIRE(test.external.output ==
		"START-PRE-GC\n" + rows + "END-PRE-GC\n" +
		"START-POST-GC\n" + rows + "END-POST-GC\n");
}

TEST_CASE("Compaction: not reported unless asked", "[compact]")
{
	TestHeap test(BlockHeap::validate_table);
	REQUIRE(test.heap.initialize(0x1000, 0x2000, 4) == Status::Ok);

	test.heap.compact();
	REQUIRE(test.heap.getNumberOfCompactions() == 1);
	REQUIRE(test.external.compactions.empty());
	REQUIRE(test.external.output.empty());
}
