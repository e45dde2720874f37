#include "services/FaceModels.hpp"
#include "ai/Embedder.hpp"
#include "config/AppConfig.hpp"
#include "detect/CascadeLocator.hpp"
#include "detect/FaceDetector.hpp"
#include "log/SystemLogger.hpp"
#include <QFileInfo>
#include <QtCore/QDebug>
#include <stdexcept>

FaceModels::FaceModels() = default;
FaceModels::~FaceModels() = default;

bool FaceModels::checkModelFile(const QString& path, const char* what)
{
	QFileInfo fi(path);
	if (!fi.exists() || !fi.isFile()) {
		SystemLogger::error("APP", QString("%1 model not found: %2").arg(QString::fromLatin1(what), path));
		qWarning() << "[FaceModels]" << what << "model not found (" << path << ")";
		return false;
	}
	if (!fi.isReadable()) {
		SystemLogger::error("APP", QString("%1 model not readable: %2").arg(QString::fromLatin1(what), path));
		qWarning() << "[FaceModels]" << what << "model not readable (perm):" << path;
		return false;
	}
	qInfo() << "[FaceModels]" << what << "bytes=" << fi.size();
	return true;
}

bool FaceModels::load(const AppConfig& cfg)
{
	int errors = 0;

	// accurate 는 항상 필요. fast 는 모드가 Fast 일 때만
	if (!loadDetector(cfg.yunetModel)) ++errors;
	if (cfg.detectionMode == DetectionMode::Fast && !loadCascade(cfg.cascadeModel)) ++errors;
	if (!loadEmbedder(cfg.embedderModel)) ++errors;

	if (errors > 0) {
		qCritical() << "[FaceModels] model load failed, errors=" << errors;
		return false;
	}

	tiered_ = std::make_unique<TieredLocator>(cascade_.get(), *yunet_);
	qInfo() << "[FaceModels] ready, mode="
			<< (cfg.detectionMode == DetectionMode::Fast ? "fast" : "accurate");
	return true;
}

bool FaceModels::loadCascade(const QString& path)
{
	if (!checkModelFile(path, "Cascade")) return false;

	CascadeLocator::Options opt;
	opt.cascadePath = path.toStdString();
	cascade_ = std::make_unique<CascadeLocator>(opt);
	if (!cascade_->isReady()) {
		SystemLogger::error("APP", QString("Cascade load failed: %1").arg(path));
		cascade_.reset();
		return false;
	}
	return true;
}

bool FaceModels::loadDetector(const QString& path)
{
	if (!checkModelFile(path, "YuNet")) return false;

	yunet_ = std::make_unique<FaceDetector>();
	if (!yunet_->init(path.toStdString())) {
		SystemLogger::error("APP", QString("YuNet init failed: %1").arg(path));
		yunet_.reset();
		return false;
	}
	return true;
}

bool FaceModels::loadEmbedder(const QString& path)
{
	if (!checkModelFile(path, "SFace")) return false;

	Embedder::Options opt;
	opt.modelPath = path;
	opt.inputSize = 112;

	embedder_ = std::make_unique<Embedder>(opt);
	if (!embedder_->isReady()) {
		SystemLogger::error("APP", "SFace recognizer not ready (net load failed)");
		qWarning() << "[FaceModels] SFace recognizer not ready";
		embedder_.reset();
		return false;
	}
	return true;
}

const FaceLocator& FaceModels::locator() const
{
	if (!tiered_) throw std::logic_error("FaceModels::locator() before load()");
	return *tiered_;
}

const FaceEmbedding& FaceModels::embedding() const
{
	if (!embedder_) throw std::logic_error("FaceModels::embedding() before load()");
	return *embedder_;
}
