#include "config/AppConfig.hpp"
#include "include/common_path.hpp"
#include <QtCore/QDebug>
#include <QtGlobal>
#include <fstream>
#include <map>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const std::map<std::string, double LivenessParams::*>& livenessDoubles()
{
	static const std::map<std::string, double LivenessParams::*> m = {
		{ "min_frame_diff",           &LivenessParams::minFrameDiff },
		{ "min_diff_variance",        &LivenessParams::minDiffVariance },
		{ "min_diff_mean",            &LivenessParams::minDiffMean },
		{ "min_brightness_variance",  &LivenessParams::minBrightnessVariance },
		{ "min_color_variance_range", &LivenessParams::minColorVarianceRange },
		{ "min_edge_variance",        &LivenessParams::minEdgeVariance },
		{ "min_box_std",              &LivenessParams::minBoxStd },
		{ "confidence_scale",         &LivenessParams::confidenceScale },
		{ "min_std_spread",           &LivenessParams::minStdSpread },
		{ "min_movement_variance",    &LivenessParams::minMovementVariance },
		{ "min_movement_mean",        &LivenessParams::minMovementMean },
		{ "min_area_variance",        &LivenessParams::minAreaVariance },
		{ "min_area_range",           &LivenessParams::minAreaRange },
		{ "min_accel_variance",       &LivenessParams::minAccelVariance },
	};
	return m;
}

const std::map<std::string, int LivenessParams::*>& livenessInts()
{
	static const std::map<std::string, int LivenessParams::*> m = {
		{ "min_frames",      &LivenessParams::minFrames },
		{ "min_face_frames", &LivenessParams::minFaceFrames },
	};
	return m;
}

QString qs(const json& j) { return QString::fromStdString(j.get<std::string>()); }

} // namespace

AppConfig AppConfig::defaults()
{
	AppConfig c;
	c.databasePath  = QStringLiteral(DB_PATH DB);
	c.logDir        = QStringLiteral(LOG_DIR);
	c.yunetModel    = QStringLiteral(YNMODEL_PATH YNMODEL);
	c.cascadeModel  = QStringLiteral(FACEDETECTOR);
	c.embedderModel = QStringLiteral(SFACE_RECOGNIZER_PATH SFACE_RECOGNIZER);
	return c;
}

DetectionMode AppConfig::parseDetectionMode(const QString& name)
{
	const QString n = name.trimmed().toLower();
	if (n == "fast" || n == "hog")      return DetectionMode::Fast;
	if (n == "accurate" || n == "cnn")  return DetectionMode::Accurate;
	throw ConfigError("Unknown detection mode: " + name.toStdString());
}

void AppConfig::applyJson(const std::string& text)
{
	json root;
	try {
		root = json::parse(text);
	} catch (const json::parse_error& e) {
		throw ConfigError(std::string("Config is not valid JSON: ") + e.what());
	}
	if (!root.is_object()) throw ConfigError("Config root must be a JSON object");

	try {
		if (root.contains("database_path")) databasePath = qs(root["database_path"]);
		if (root.contains("log_dir"))       logDir       = qs(root["log_dir"]);
		if (root.contains("log_level")) {
			bool ok = false;
			logLevel = Logger::levelFromString(qs(root["log_level"]), &ok);
			if (!ok) throw ConfigError("Unknown log_level: " + root["log_level"].get<std::string>());
		}
		if (root.contains("detection_mode")) detectionMode = parseDetectionMode(qs(root["detection_mode"]));

		if (root.contains("models")) {
			const json& m = root["models"];
			if (m.contains("yunet"))    yunetModel    = qs(m["yunet"]);
			if (m.contains("cascade"))  cascadeModel  = qs(m["cascade"]);
			if (m.contains("embedder")) embedderModel = qs(m["embedder"]);
		}

		if (root.contains("match") && root["match"].contains("tolerances")) {
			match.tolerances = root["match"]["tolerances"].get<std::vector<float>>();
		}

		if (root.contains("gallery") && root["gallery"].contains("ttl_seconds")) {
			galleryTtlSec = root["gallery"]["ttl_seconds"].get<int>();
		}

		if (root.contains("liveness")) {
			const json& l = root["liveness"];
			if (!l.is_object()) throw ConfigError("liveness must be an object");
			for (auto it = l.begin(); it != l.end(); ++it) {
				if (auto d = livenessDoubles().find(it.key()); d != livenessDoubles().end()) {
					liveness.*(d->second) = it.value().get<double>();
				} else if (auto i = livenessInts().find(it.key()); i != livenessInts().end()) {
					liveness.*(i->second) = it.value().get<int>();
				} else {
					throw ConfigError("Unknown liveness parameter: " + it.key());
				}
			}
		}
	} catch (const json::type_error& e) {
		throw ConfigError(std::string("Config value has wrong type: ") + e.what());
	}
}

void AppConfig::applyEnvironment()
{
	if (qEnvironmentVariableIsSet("ATTENDFACE_DATABASE_PATH"))
		databasePath = qEnvironmentVariable("ATTENDFACE_DATABASE_PATH");
	if (qEnvironmentVariableIsSet("ATTENDFACE_LOG_DIR"))
		logDir = qEnvironmentVariable("ATTENDFACE_LOG_DIR");
	if (qEnvironmentVariableIsSet("ATTENDFACE_LOG_LEVEL")) {
		bool ok = false;
		logLevel = Logger::levelFromString(qEnvironmentVariable("ATTENDFACE_LOG_LEVEL"), &ok);
		if (!ok) throw ConfigError("Unknown ATTENDFACE_LOG_LEVEL");
	}
	if (qEnvironmentVariableIsSet("FACE_RECOGNITION_MODEL"))
		detectionMode = parseDetectionMode(qEnvironmentVariable("FACE_RECOGNITION_MODEL"));

	// 기본 허용치만 바꾸고 완화 단계는 유지
	if (qEnvironmentVariableIsSet("FACE_RECOGNITION_TOLERANCE")) {
		bool ok = false;
		const float tol = qEnvironmentVariable("FACE_RECOGNITION_TOLERANCE").toFloat(&ok);
		if (!ok) throw ConfigError("FACE_RECOGNITION_TOLERANCE is not a number");
		if (match.tolerances.empty()) match.tolerances.push_back(tol);
		else match.tolerances.front() = tol;
	}
}

void AppConfig::validate() const
{
	if (databasePath.isEmpty()) throw ConfigError("database_path must not be empty");
	if (match.tolerances.empty()) throw ConfigError("match.tolerances must not be empty");
	for (size_t i = 0; i < match.tolerances.size(); ++i) {
		if (!(match.tolerances[i] > 0.0f))
			throw ConfigError("match.tolerances must be positive");
		if (i > 0 && match.tolerances[i] < match.tolerances[i - 1])
			throw ConfigError("match.tolerances must be ascending");
	}
	if (galleryTtlSec < 0) throw ConfigError("gallery.ttl_seconds must not be negative");
	if (liveness.minFrames < 2) throw ConfigError("liveness.min_frames must be at least 2");
	if (liveness.minFaceFrames < 2) throw ConfigError("liveness.min_face_frames must be at least 2");
	if (!(liveness.confidenceScale > 0.0)) throw ConfigError("liveness.confidence_scale must be positive");
}

AppConfig AppConfig::load(const QString& path)
{
	AppConfig c = defaults();

	if (!path.isEmpty()) {
		std::ifstream in(path.toStdString());
		if (!in.is_open()) throw ConfigError("Cannot open config file: " + path.toStdString());
		std::stringstream ss;
		ss << in.rdbuf();
		c.applyJson(ss.str());
		qInfo() << "[AppConfig] loaded" << path;
	}

	c.applyEnvironment();
	c.validate();
	return c;
}
