#include <GlobalHeap.h>

#include <catch2/catch.hpp>

// The global heap is constructed once per process and keeps a reference to
// its interface, so everything about it is checked in this one test case.
TEST_CASE("GlobalHeap: a failed initialization is survivable when permissive and the heap is created once", "[global]")
{
	static HeapInterface heap_interface;
	heap_interface.permissive = true;

	// A reversed range is rejected before any table memory is touched
	BlockHeap & heap = CreateGlobalHeap(heap_interface, 0x2000, 0x1000, 4, BlockHeap::heap_fast);
	REQUIRE_FALSE(heap.isInitialized());
	REQUIRE(heap.allocate(16).status == BlockHeap::Status::NotInitialized);

	BlockHeap & again = CreateGlobalHeap(heap_interface, 0x1000, 0x2000, 4, BlockHeap::heap_fast);
	REQUIRE(&again == &heap);
	REQUIRE_FALSE(again.isInitialized());
	REQUIRE(again.getCapacity() == 0);
}
