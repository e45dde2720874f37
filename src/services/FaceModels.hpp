#pragma once
#include <memory>
#include <QString>
#include "detect/FaceLocator.hpp"
#include "ai/FaceEmbedding.hpp"

struct AppConfig;
class CascadeLocator;
class FaceDetector;
class Embedder;

// 검출기/임베더 모델 소유. 설정의 경로로 한 번 로드한다
class FaceModels {
	public:
		FaceModels();
		~FaceModels();

		// 실패한 모델마다 로그를 남기고 false
		bool load(const AppConfig& cfg);

		// load() 성공 후에만 유효
		const FaceLocator&   locator() const;
		const FaceEmbedding& embedding() const;

	private:
		bool loadCascade(const QString& path);
		bool loadDetector(const QString& path);
		bool loadEmbedder(const QString& path);

		static bool checkModelFile(const QString& path, const char* what);

	private:
		std::unique_ptr<CascadeLocator> cascade_;
		std::unique_ptr<FaceDetector>   yunet_;
		std::unique_ptr<TieredLocator>  tiered_;
		std::unique_ptr<Embedder>       embedder_;
};
