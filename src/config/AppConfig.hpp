#pragma once
#include <stdexcept>
#include <string>
#include <QString>
#include "liveness/LivenessGate.hpp"
#include "logger.hpp"
#include "match/FaceMatcher.hpp"

class ConfigError : public std::runtime_error {
	public:
		explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class DetectionMode {
	Fast,		// Haar -> YuNet
	Accurate	// YuNet 만
};

struct AppConfig {
	QString databasePath;
	QString logDir;
	Logger::Level logLevel = Logger::Level::Info;

	QString yunetModel;
	QString cascadeModel;
	QString embedderModel;
	DetectionMode detectionMode = DetectionMode::Fast;

	MatchParams    match;
	int            galleryTtlSec = recog::GALLERY_TTL_SEC;
	LivenessParams liveness;

	// common_path.hpp / recog_params.hpp 기본값
	static AppConfig defaults();

	// path 가 비어있으면 기본값 + 환경변수. 파일 오류/값 오류는 ConfigError
	static AppConfig load(const QString& path);

	static DetectionMode parseDetectionMode(const QString& name);

	void applyJson(const std::string& text);
	void applyEnvironment();
	void validate() const;
};
