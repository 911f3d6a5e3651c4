#pragma once
#include <QDateTime>
#include <QVector>
#include <QString>
#include "include/LogDtos.hpp"

// 스키마 관리 + system_logs 접근. 도메인 테이블은 store/ 가 다룬다
class QSqliteService {
public:
    static constexpr int kSchemaVersion = 1;

    // 스키마 생성 (idempotent). 더 새로운 버전의 DB 면 실패
    bool initializeDatabase();
    int schemaVersion();

    // 시스템로그 입력
    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

    // 조회(페이징/필터)
    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike, const QString& sinceIso,
                          QVector<SystemLog>* outRows,
                          int* outTotal);

    // 보존 기간 지난 로그 삭제. 지운 행 수, 실패 -1
    int purgeSystemLogsBefore(const QDateTime& cutoff);
	bool deleteSysLogs();
};
