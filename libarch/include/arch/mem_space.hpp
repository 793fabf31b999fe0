#ifndef LIBARCH_MEM_SPACE_HPP
#define LIBARCH_MEM_SPACE_HPP

#include <stddef.h>
#include <stdint.h>

#include <arch/register.hpp>

#if !defined(__x86_64__) && !defined(__aarch64__)
#error "libarch: unsupported architecture"
#endif

namespace arch {

namespace _detail {
	// Device memory is accessed with a single load or store of exactly the
	// register width; the compiler may neither split, merge nor elide it.
	// On aarch64 "Q" keeps the address a plain base register, so that no
	// writeback addressing mode is generated.
	template<typename B>
	struct mem_ops {
		static_assert(sizeof(B) == 1 || sizeof(B) == 2 || sizeof(B) == 4 || sizeof(B) == 8,
				"unsupported access width");

		static void store(B *p, B v) {
#if defined(__x86_64__)
			asm volatile ("mov %0, %1" : : "r"(v), "m"(*p) : "memory");
#else
			if constexpr (sizeof(B) == 1)
				asm volatile ("strb %w0, %1" : : "r"(v), "Q"(*p) : "memory");
			else if constexpr (sizeof(B) == 2)
				asm volatile ("strh %w0, %1" : : "r"(v), "Q"(*p) : "memory");
			else if constexpr (sizeof(B) == 4)
				asm volatile ("str %w0, %1" : : "r"(v), "Q"(*p) : "memory");
			else
				asm volatile ("str %x0, %1" : : "r"(v), "Q"(*p) : "memory");
#endif
		}

		static B load(const B *p) {
			B v;
#if defined(__x86_64__)
			asm volatile ("mov %1, %0" : "=r"(v) : "m"(*p) : "memory");
#else
			if constexpr (sizeof(B) == 1)
				asm volatile ("ldrb %w0, %1" : "=r"(v) : "Q"(*p) : "memory");
			else if constexpr (sizeof(B) == 2)
				asm volatile ("ldrh %w0, %1" : "=r"(v) : "Q"(*p) : "memory");
			else if constexpr (sizeof(B) == 4)
				asm volatile ("ldr %w0, %1" : "=r"(v) : "Q"(*p) : "memory");
			else
				asm volatile ("ldr %x0, %1" : "=r"(v) : "Q"(*p) : "memory");
#endif
			return v;
		}
	};

	// Registers at fixed offsets from an identity-mapped base address.
	struct mem_space {
		constexpr mem_space()
		: _base(0) { }

		constexpr mem_space(void *base)
		: _base(uintptr_t(base)) { }

		explicit constexpr mem_space(uintptr_t base)
		: _base(base) { }

		template<typename RT>
		void store(RT r, typename RT::rep_type value) const {
			auto p = reinterpret_cast<typename RT::bits_type *>(_base + r.offset());
			mem_ops<typename RT::bits_type>::store(p, static_cast<typename RT::bits_type>(value));
		}

		template<typename RT>
		typename RT::rep_type load(RT r) const {
			auto p = reinterpret_cast<const typename RT::bits_type *>(_base + r.offset());
			return static_cast<typename RT::rep_type>(mem_ops<typename RT::bits_type>::load(p));
		}

	private:
		uintptr_t _base;
	};
}

using _detail::mem_space;

} // namespace arch

#endif // LIBARCH_MEM_SPACE_HPP
