/**
 * @file logger.hpp
 * @brief Unified logging infrastructure for desktop and Android builds
 *
 * Purpose: One printf-style logging interface for every emulator component.
 * Desktop builds write to stdout/stderr, Android builds go to logcat.
 *
 * References:
 * - Android NDK logging: https://developer.android.com/ndk/reference/group/logging
 *
 * Sample Input:
 *   LOG_INFO("Camera started: %dx%d @ %d fps", w, h, fps);
 *
 * Expected Output:
 *   Desktop: "[INFO] Camera started: 320x240 @ 30 fps"
 *   Android: logcat shows "I/SensorEmu: Camera started: 320x240 @ 30 fps"
 */

#ifndef SENSEMU_UTILS_LOGGER_HPP
#define SENSEMU_UTILS_LOGGER_HPP

#ifdef ANDROID
#include <android/log.h>
#define LOG_TAG "SensorEmu"
#define LOG_INFO(...) __android_log_print(ANDROID_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOG_WARN(...) __android_log_print(ANDROID_LOG_WARN, LOG_TAG, __VA_ARGS__)
#define LOG_ERROR(...) __android_log_print(ANDROID_LOG_ERROR, LOG_TAG, __VA_ARGS__)
#define LOG_DEBUG(...) __android_log_print(ANDROID_LOG_DEBUG, LOG_TAG, __VA_ARGS__)
#else
#include <cstdio>
#define LOG_INFO(...) do { std::printf("[INFO] " __VA_ARGS__); std::printf("\n"); } while(0)
#define LOG_WARN(...) do { std::fprintf(stderr, "[WARN] " __VA_ARGS__); std::fprintf(stderr, "\n"); } while(0)
#define LOG_ERROR(...) do { std::fprintf(stderr, "[ERROR] " __VA_ARGS__); std::fprintf(stderr, "\n"); } while(0)
#ifdef SENSEMU_VERBOSE
#define LOG_DEBUG(...) do { std::printf("[DEBUG] " __VA_ARGS__); std::printf("\n"); } while(0)
#else
#define LOG_DEBUG(...) do { } while(0)
#endif
#endif

#endif // SENSEMU_UTILS_LOGGER_HPP
