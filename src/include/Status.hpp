#pragma once
#include <QString>
#include <QMetaType>

// 도메인 연산 결과 코드
enum class ErrorCode {
	Ok = 0,
	InvalidEmbedding,					// 길이 0 / 비유한 값 / norm 0
	InvalidArgument,					// 빈 이름, 잘못된 구간 등
	NotFound,							// 프로필/임베딩/미디어 없음 (병합으로 흡수된 경우 포함)
	ProfileGone,						// 쓰기 대상이 방금 병합으로 흡수됨 -> redirect 따라 1회 재시도
	InvalidMergeRequest,				// target이 sources에 포함, sources 비어있음
	ConcurrentModificationConflict,		// version 불일치
	StorageError						// SQL 실패
};

inline const char* errorCodeName(ErrorCode c)
{
	switch (c) {
		case ErrorCode::Ok:								return "Ok";
		case ErrorCode::InvalidEmbedding:				return "InvalidEmbedding";
		case ErrorCode::InvalidArgument:				return "InvalidArgument";
		case ErrorCode::NotFound:						return "NotFound";
		case ErrorCode::ProfileGone:					return "ProfileGone";
		case ErrorCode::InvalidMergeRequest:			return "InvalidMergeRequest";
		case ErrorCode::ConcurrentModificationConflict:	return "ConcurrentModificationConflict";
		case ErrorCode::StorageError:					return "StorageError";
	}
	return "Unknown";
}

struct Status {
	ErrorCode	code = ErrorCode::Ok;
	QString		message;
	qint64		redirectTo = -1;		// ProfileGone 일 때만 유효

	bool ok() const { return code == ErrorCode::Ok; }
	bool retryable() const {
		return code == ErrorCode::ProfileGone || code == ErrorCode::ConcurrentModificationConflict;
	}

	static Status success() { return Status{}; }
	static Status error(ErrorCode c, const QString& msg) {
		Status s;
		s.code = c;
		s.message = msg;
		return s;
	}
	static Status gone(qint64 profileId, qint64 target) {
		Status s;
		s.code = ErrorCode::ProfileGone;
		s.message = QString("profile %1 was absorbed into %2").arg(profileId).arg(target);
		s.redirectTo = target;
		return s;
	}

	QString toString() const {
		if (ok()) return QStringLiteral("Ok");
		return QString("%1: %2").arg(QLatin1String(errorCodeName(code)), message);
	}
};

Q_DECLARE_METATYPE(Status)
