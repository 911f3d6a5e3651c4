#pragma once
#include <QString>
#include <QDateTime>

// 시스템 로그 DTO (system_logs 테이블 1행)
struct SystemLog {
    qint64 id{};
    int level{};        // 0~4
    QString tag;        // "MATCH", "SUGG", "RETRO", "MERGE", "STORE", "APP"
    QString message;
    QDateTime timestamp;
    QString extra;
};
