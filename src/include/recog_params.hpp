#pragma once

namespace recog {
	// 신뢰도 등급 경계 (score >= HIGH -> high, score >= MEDIUM -> medium)
	inline constexpr double HIGH_THR			= 0.75;
	inline constexpr double MEDIUM_THR			= 0.50;

	// 매처 스캔 시간 예산: BASE + PER_EMB * N
	inline constexpr int	MATCH_BASE_BUDGET_MS		= 250;
	inline constexpr int	MATCH_PER_EMB_BUDGET_US		= 50;

	// 병합 version 충돌 재시도 횟수
	inline constexpr int	MERGE_CONFLICT_RETRIES		= 3;

	// redirect 체인 최대 길이 / 보존 시간
	inline constexpr int	REDIRECT_MAX_HOPS			= 8;
	inline constexpr int	REDIRECT_TTL_SEC			= 600;

	// system_logs 보존 기간
	inline constexpr int	LOG_RETENTION_DAYS			= 30;

	// SQLite busy timeout
	inline constexpr int	SQL_BUSY_TIMEOUT_MS			= 5000;
}
