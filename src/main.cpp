#include <GlobalHeap.h>

#include <vector>

#include <assert.h>
#include <stdio.h>
#include <stdlib.h>
#include <stdint.h>

int constexpr number_of_allocations = 4 * 1024;
int constexpr heap_size = 64 * 1024 * 1024;
BlockAddress pointer[number_of_allocations];
std::vector<int> full;
std::vector<int> empty;

int main()
{
	srand(0);

	// Host memory stands in for the kernel's identity mapped heap
	std::vector<uint8_t> region(heap_size + 64);
	BlockAddress const region_start = reinterpret_cast<uintptr_t>(region.data());
	BlockAddress const heap_start = (region_start + 63) & ~BlockAddress(63);
	BlockAddress const heap_end = heap_start + heap_size;

	HeapInterface heap_interface;
	BlockHeap & heap = CreateGlobalHeap(heap_interface, heap_start, heap_end, 16 * 1024, BlockHeap::heap_kernel | BlockHeap::report_compaction);

	empty.reserve(number_of_allocations);
	full.reserve(number_of_allocations);
	for (int i = 0; i < number_of_allocations; ++i)
		empty.push_back(i);

	constexpr bool verify = false;

	int failed = 0;
	int constexpr loop_count = 1'000'000;
	for (int loops = 0; loops < loop_count; ++loops)
	{
		assert(full.size() + empty.size() == number_of_allocations);

		if ((loops % 100'000) == 1)
			printf("loop %d live=%d/%d balance=%lld\n", loops, heap.getLiveCount(), heap.getCapacity(), static_cast<long long>(heap.allocationBalance()));

		int const operation = rand() % number_of_allocations;
		if (operation <= static_cast<int>(empty.size()))
		{
			if (empty.size())
			{
				int const size = 1 + rand() % (16 * 1024);
				int const alignment = (size & 1) ? 0 : 1 << (rand() % 7);
				BlockHeap::Allocation const allocation = heap.allocate(size, alignment);
				if (!allocation.succeeded())
				{
					++failed;
					continue;
				}

				int const slot = empty.back();
				empty.pop_back();
				pointer[slot] = allocation.address;
				full.push_back(slot);

				// Verify the heap after every operation
				if constexpr (verify)
					heap.verify();
			}
		}
		else
		{
			if (full.size())
			{
				int const allocation = rand() % full.size();
				int const slot = full[allocation];
				full[allocation] = full.back();
				full.pop_back();
				BlockAddress const p = pointer[slot];
				pointer[slot] = 0;
				empty.push_back(slot);
				heap.deallocate(p);

				// Freeing twice must be harmless
				if (p & 1)
					heap.deallocate(p);

				// Verify the heap after every operation
				if constexpr (verify)
					heap.verify();
			}
		}
	}

	printf("failed allocations: %d\n", failed);
	printf("compactions: %d\n", heap.getNumberOfCompactions());

	// Print memory leaks
	printf("memory leaks:\n");
	heap.reportAllocations();

	for (int const slot : full)
		heap.deallocate(pointer[slot]);
	full.clear();

	heap.compact();
	heap.verify();
	heap.sendDebugDump("FINAL");

	printf("allocation balance: %lld\n", static_cast<long long>(heap.allocationBalance()));
	return heap.hasLeaks() ? 1 : 0;
}
