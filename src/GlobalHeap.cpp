#include <GlobalHeap.h>

#include <new>

#include <stdint.h>

// Interrupt masking only exists in the freestanding kernel build
#if defined(BLOCKHEAP_KERNEL) && defined(__x86_64__)
	#define USE_INTERRUPT_MASKING        1
#else
	#define USE_INTERRUPT_MASKING        0
#endif

namespace
{
	alignas(BlockHeap) unsigned char global_heap_storage[sizeof(BlockHeap)];
	BlockHeap * global_heap = nullptr;

#if USE_INTERRUPT_MASKING

	constexpr uint64_t InterruptEnableFlag = 1 << 9;

	uint64_t DisableInterrupts()
	{
		uint64_t rflags;
		__asm__ volatile("pushfq\n\tpopq %0\n\tcli" : "=r"(rflags) : : "memory");
		return rflags;
	}

	void RestoreInterrupts(uint64_t const rflags)
	{
		if (rflags & InterruptEnableFlag)
			__asm__ volatile("sti" : : : "memory");
	}

	[[noreturn]] void Halt()
	{
		for (;;)
			__asm__ volatile("cli\n\thlt");
	}

#else

	uint64_t DisableInterrupts()
	{
		return 0;
	}

	void RestoreInterrupts(uint64_t)
	{
	}

#endif
}

void HeapInterface::lock()
{
	// Mask first, a handler taking the lock on this core would spin forever
	uint64_t const state = DisableInterrupts();
	DefaultInterface::lock();
	saved_interrupt_state = state;
}

void HeapInterface::unlock()
{
	uint64_t const state = saved_interrupt_state;
	DefaultInterface::unlock();
	RestoreInterrupts(state);
}

void HeapInterface::report_operation(BlockAddress const address, uint64_t const size, uint64_t const alignment, BlockHeap::Flags const flags)
{
	if (!report_operations)
		return;
	DefaultInterface::report_operation(address, size, alignment, flags);
}

void HeapInterface::terminate()
{
	// Ignore errors if asked to
	if (permissive)
		return;

#if USE_INTERRUPT_MASKING
	Halt();
#else
	DefaultInterface::terminate();
#endif
}

BlockHeap & CreateGlobalHeap(HeapInterface & heap_interface, BlockAddress const heap_start, BlockAddress const heap_end, int const capacity, BlockHeap::Flags const flags)
{
	if (global_heap)
		return *global_heap;

	global_heap = new(static_cast<void *>(global_heap_storage)) BlockHeap(heap_interface, flags);

	BlockHeap::Status const status = global_heap->initialize(heap_start, heap_end, capacity);
	if (status != BlockHeap::Status::Ok)
	{
		BlockHeap::ErrorInfo info;
		info.type = BlockHeap::ErrorInfo::Type::Assert;
		info.assert = "global heap initialization failed";
		info.file = __FILE__;
		info.line = __LINE__;
		info.address = heap_start;
		info.size = heap_end - heap_start;
		info.capacity = capacity;
		heap_interface.error(info);
	}

	return *global_heap;
}
