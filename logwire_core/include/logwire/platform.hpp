#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define LOGWIRE_PLATFORM_LINUX 1
#elif defined(_WIN32)
    #define LOGWIRE_PLATFORM_WINDOWS 1
#elif defined(__APPLE__)
    #define LOGWIRE_PLATFORM_MACOS 1
#endif

// ===== 后端线程 =====
#ifndef LOGWIRE_HAS_THREAD
    #define LOGWIRE_HAS_THREAD 1
#endif

// ===== Ring Buffer 默认大小 =====
#ifndef LOGWIRE_RING_SIZE
    #define LOGWIRE_RING_SIZE 4096
#endif

// ===== 日志消息最大长度 =====
#ifndef LOGWIRE_MAX_MSG_LEN
    #define LOGWIRE_MAX_MSG_LEN 512
#endif

// ===== Label 常量（写入 entry.labels） =====
#ifndef LOGWIRE_MAX_LABELS
    #define LOGWIRE_MAX_LABELS 8
#endif
#ifndef LOGWIRE_MAX_LABEL_KEY_LEN
    #define LOGWIRE_MAX_LABEL_KEY_LEN 32
#endif
#ifndef LOGWIRE_MAX_LABEL_VAL_LEN
    #define LOGWIRE_MAX_LABEL_VAL_LEN 64
#endif

// ===== cacheline 大小 =====
#ifndef LOGWIRE_CACHELINE_SIZE
    #define LOGWIRE_CACHELINE_SIZE 64
#endif
