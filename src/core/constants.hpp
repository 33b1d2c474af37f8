#pragma once

#include <core/types.hpp>

#define SLURMLED_VERSION "0.4.0"

// ── Poll cadence ────────────────────────────────────────────
constexpr int JOBS_POLL_INTERVAL_SECS    = 30;    // Primary monitor (squeue)
constexpr int NODES_POLL_INTERVAL_SECS   = 5;     // Secondary monitor (sinfo over SSH)
constexpr int STOP_CHECK_SLICE_MS        = 100;   // Sleep granularity between ticks

// ── Timeouts ────────────────────────────────────────────────
constexpr int LOCAL_QUERY_TIMEOUT_SECS   = 30;    // docker exec ... squeue
constexpr int REMOTE_CONNECT_TIMEOUT_SECS = 5;    // TCP connect + handshake
constexpr int REMOTE_QUERY_TIMEOUT_SECS  = 10;    // Whole remote call, connect included
constexpr int PROCESS_TERM_GRACE_MS      = 2000;  // SIGTERM → SIGKILL escalation

// ── Failure log throttling ──────────────────────────────────
constexpr int FAILURE_LOG_REPEAT_EVERY   = 10;    // Log every Nth identical failure

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE         = 4096;
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Scheduler commands ──────────────────────────────────────
constexpr const char* DEFAULT_DOCKER_CMD       = "docker";
constexpr const char* DEFAULT_CONTAINER        = "login";
constexpr const char* DEFAULT_QUANTUM_PARTITION = "quantum";
constexpr const char* SQUEUE_FORMAT            = "%i %P %j";
constexpr const char* SINFO_FORMAT             = "%N %T";

// ── Remote controller ───────────────────────────────────────
constexpr const char* DEFAULT_REMOTE_HOST = "192.168.4.160";
constexpr const char* DEFAULT_REMOTE_USER = "rasqberry";
constexpr int SSH_PORT                    = 22;

// ── GPIO (BCM numbering) ────────────────────────────────────
constexpr const char* DEFAULT_GPIO_CHIP  = "/dev/gpiochip0";
constexpr unsigned DEFAULT_NORMAL_PIN    = 17;    // Green indicator
constexpr unsigned DEFAULT_QUANTUM_PIN   = 27;    // Blue indicator
constexpr int SELF_TEST_STEP_MS          = 300;

// ── Pixel matrix ────────────────────────────────────────────
constexpr const char* DEFAULT_SPI_DEVICE = "/dev/spidev0.0";
constexpr const char* DEFAULT_MATRIX_LOCK = "/run/lock/slurmled-matrix.lock";
constexpr int MATRIX_WIDTH               = 24;
constexpr int MATRIX_HEIGHT              = 8;
constexpr double DEFAULT_BRIGHTNESS      = 0.5;
constexpr int WS2812_SPI_HZ              = 2400000;  // 3 SPI bits per WS2812 bit
constexpr int WS2812_RESET_BYTES         = 40;       // >50us low latch at 2.4 MHz

// Matrix text placement (columns) for each partition-activity combination
constexpr int MATRIX_HPC_X   = 3;
constexpr int MATRIX_Q_X     = 9;
constexpr int MATRIX_QCSC_X  = 1;

// ── Colors ──────────────────────────────────────────────────
constexpr Rgb COLOR_CLASSICAL = {0, 255, 0};    // Green
constexpr Rgb COLOR_QUANTUM   = {0, 150, 255};  // Blue
constexpr Rgb COLOR_OFF       = {0, 0, 0};

// ── Process exit codes ──────────────────────────────────────
constexpr int EXIT_CLEAN          = 0;
constexpr int EXIT_CONFIG_FAILURE = 1;
constexpr int EXIT_HARDWARE_CLAIM = 2;
