#pragma once
#include <cstdarg>
#include <cstdio>
#include <spdlog/spdlog.h>

inline void log_printf_impl(spdlog::level::level_enum lvl, const char* format, ...) {
	if (!spdlog::should_log(lvl)) {
		return;
	}
	char buf[1024];
	va_list args;
	va_start(args, format);
	vsnprintf(buf, sizeof(buf), format, args);
	va_end(args);
	spdlog::log(lvl, "{}", buf);
}

#define LOG_D(format, ...) \
	do { \
		log_printf_impl(spdlog::level::debug, format __VA_OPT__(,) __VA_ARGS__); \
	} while (0)

#define LOG_I(format, ...) \
	do { \
		log_printf_impl(spdlog::level::info, format __VA_OPT__(,) __VA_ARGS__); \
	} while (0)

#define LOG_W(format, ...) \
	do { \
		log_printf_impl(spdlog::level::warn, format __VA_OPT__(,) __VA_ARGS__); \
	} while (0)

#define LOG_E(format, ...) \
	do { \
		log_printf_impl(spdlog::level::err, format __VA_OPT__(,) __VA_ARGS__); \
	} while (0)
