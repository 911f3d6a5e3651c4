#pragma once
#include <vector>
#include <QByteArray>
#include <QString>

#include "include/types.hpp"

// voiceprint 테이블. 임베딩은 한번 쓰면 변경하지 않는다 (소유 프로필만 바뀜)
// 트랜잭션은 호출측(ProfileStore/MergeEngine)이 연다
class EmbeddingStore {
public:
	// float32 little-endian
	static QByteArray encodeVector(const std::vector<float>& v);
	static bool decodeVector(const QByteArray& blob, int dim, std::vector<float>* out);

	// 길이 0, NaN/Inf, norm 0 -> InvalidEmbedding
	static Status validateVector(const std::vector<float>& v);

	Status insertEmbedding(qint64 mediaItemId, const QString& label,
						   const std::vector<float>& v, qint64 ownerProfileId, qint64* outId);

	Status findEmbedding(qint64 mediaItemId, const QString& label, Embedding* out) const;
	Status getEmbedding(qint64 embeddingId, Embedding* out) const;

	bool embeddingsOfProfile(qint64 profileId, std::vector<Embedding>* out) const;
	bool allEmbeddings(std::vector<Embedding>* out) const;
	int  countOfProfile(qint64 profileId) const;		// 실패 시 -1

	bool moveEmbedding(qint64 embeddingId, qint64 toProfileId);
	int  reassignOwner(qint64 fromProfileId, qint64 toProfileId);		// 옮긴 개수, 실패 -1

	// 미디어 삭제 시에만. 삭제 전 소유자였던 프로필 id 를 돌려준다
	bool deleteForMediaItem(qint64 mediaItemId, std::vector<qint64>* formerOwners);
};
