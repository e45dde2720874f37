#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>
#include <chrono>
#include <cstdio>
#include <exception>
#include "config/AppConfig.hpp"
#include "codec/ImagePayload.hpp"
#include "include/common_path.hpp"
#include "extract/DescriptorExtractor.hpp"
#include "gallery/GalleryCache.hpp"
#include "liveness/LivenessGate.hpp"
#include "log/SystemLogger.hpp"
#include "logger.hpp"
#include "match/FaceMatcher.hpp"
#include "services/AttendanceRecognitionService.hpp"
#include "services/FaceDataRepository.hpp"
#include "services/FaceModels.hpp"
#include "services/QSqliteService.hpp"

namespace {

enum ExitCode { ExitOk = 0, ExitRejected = 1, ExitError = 2 };

void printJson(const QJsonObject& o)
{
	const QByteArray out = QJsonDocument(o).toJson(QJsonDocument::Indented);
	std::fwrite(out.constData(), 1, static_cast<size_t>(out.size()), stdout);
	std::fflush(stdout);
}

int fail(const QString& message)
{
	printJson(QJsonObject{ { "success", false }, { "error", message } });
	return ExitError;
}

// --base64 이면 파일 내용이 이미 payload
QString readPayload(const QString& path, bool isBase64)
{
	QFile f(path);
	if (!f.open(QIODevice::ReadOnly)) {
		throw ImageDecodeError("Cannot read image file: " + path.toStdString());
	}
	const QByteArray bytes = f.readAll();
	if (isBase64) return QString::fromLatin1(bytes).trimmed();
	return QString::fromLatin1(bytes.toBase64());
}

int parseEmployee(const QCommandLineParser& p, bool* ok)
{
	*ok = false;
	if (!p.isSet("employee")) return -1;
	const int id = p.value("employee").toInt(ok);
	if (*ok && id < 0) *ok = false;
	return id;
}

int runLogs(QSqliteService& db, const QCommandLineParser& p)
{
	if (p.isSet("clear")) {
		if (!db.deleteSysLogs()) return fail("Failed to clear system logs");
		printJson(QJsonObject{ { "success", true }, { "message", "System logs cleared" } });
		return ExitOk;
	}

	int limit = 50;
	if (p.isSet("limit")) {
		bool ok = false;
		limit = p.value("limit").toInt(&ok);
		if (!ok || limit <= 0) return fail("--limit must be a positive number");
	}

	QVector<SystemLog> rows;
	int total = 0;
	if (!db.selectSystemLogs(0, limit, 0, QString(), QString(), &rows, &total)) {
		return fail("Failed to read system logs");
	}

	QJsonArray arr;
	for (const auto& r : rows) {
		arr.append(QJsonObject{
			{ "id", r.id },
			{ "level", r.level },
			{ "tag", r.tag },
			{ "message", r.message },
			{ "timestamp", r.timestamp.toString(Qt::ISODate) },
			{ "extra", r.extra },
		});
	}
	printJson(QJsonObject{ { "success", true }, { "total", total }, { "logs", arr } });
	return ExitOk;
}

int runMigrate(FaceDataRepository& repo)
{
	FaceDataRepository::MigrationReport rep;
	if (!repo.migrateLegacyRows(&rep)) return fail("Legacy descriptor migration failed");
	printJson(QJsonObject{ { "success", true }, { "migrated", rep.migrated }, { "broken", rep.broken } });
	return ExitOk;
}

int runCommand(const QString& command, const QCommandLineParser& p, const AppConfig& cfg, QSqliteService& db)
{
	FaceDataRepository repo(db);

	if (command == "logs")    return runLogs(db, p);
	if (command == "migrate") return runMigrate(repo);

	// 모델이 필요 없는 명령
	GalleryCache gallery(repo, std::chrono::seconds(cfg.galleryTtlSec));
	FaceMatcher matcher(cfg.match);

	if (command == "remove") {
		bool ok = false;
		const int id = parseEmployee(p, &ok);
		if (!ok) return fail("remove requires --employee N");
		if (!repo.removeDescriptor(id)) return fail("Failed to remove face data");
		gallery.invalidate();
		SystemLogger::info("ENROLL", QString("Face data removed for employee %1").arg(id));
		printJson(QJsonObject{ { "success", true }, { "employee_id", id } });
		return ExitOk;
	}

	if (command != "enroll" && command != "recognize" && command != "liveness") {
		return fail("Unknown command: " + command);
	}

	FaceModels models;
	if (!models.load(cfg)) return fail("Face models could not be loaded");

	DescriptorExtractor extractor(models.locator(), models.embedding());
	LivenessGate liveness(models.locator(), cfg.liveness);
	AttendanceRecognitionService service(extractor, gallery, matcher, repo, liveness);
	const bool b64 = p.isSet("base64");

	if (command == "enroll") {
		bool ok = false;
		const int id = parseEmployee(p, &ok);
		if (!ok || !p.isSet("image")) return fail("enroll requires --employee N --image FILE");
		const EnrollOutcome r = service.enroll(id, readPayload(p.value("image"), b64));
		printJson(QJsonObject{ { "success", r.ok }, { "employee_id", id }, { "message", r.message } });
		return r.ok ? ExitOk : ExitRejected;
	}

	if (command == "recognize") {
		if (!p.isSet("image")) return fail("recognize requires --image FILE");
		const RecognitionOutcome r = service.recognize(readPayload(p.value("image"), b64));
		if (r.status == RecognitionOutcome::Status::Error) return fail(r.message);

		QJsonObject o{
			{ "success", r.recognized() },
			{ "status", AttendanceRecognitionService::statusName(r.status) },
			{ "message", r.message },
		};
		if (r.recognized()) o.insert("employee_id", r.employeeId);
		if (r.distance >= 0.0f) {
			o.insert("distance", static_cast<double>(r.distance));
			o.insert("similarity", static_cast<double>(r.similarity));
		}
		printJson(o);
		return r.recognized() ? ExitOk : ExitRejected;
	}

	// liveness FILE...
	const QStringList files = p.positionalArguments().mid(1);
	if (files.isEmpty()) return fail("liveness requires frame files");
	QStringList payloads;
	for (const auto& f : files) payloads << readPayload(f, b64);

	const LivenessResult r = service.verifyLiveness(payloads);
	printJson(QJsonObject{
		{ "success", r.isLive },
		{ "is_live", r.isLive },
		{ "confidence", static_cast<double>(r.confidence) },
		{ "reason", r.reason },
	});
	return r.isLive ? ExitOk : ExitRejected;
}

} // namespace

int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("attendface");

	qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} - %{message}"));

	QCommandLineParser parser;
	parser.setApplicationDescription("Face recognition for employee attendance");
	parser.addHelpOption();
	parser.addPositionalArgument("command", "enroll | recognize | liveness | remove | migrate | logs");
	parser.addPositionalArgument("files", "Frame files for liveness", "[files...]");
	parser.addOptions({
		{ "config",   "JSON config file.", "file" },
		{ "base64",   "Input files contain base64 payloads." },
		{ "employee", "Employee id.", "id" },
		{ "image",    "Image file.", "file" },
		{ "limit",    "Number of log rows (logs).", "n" },
		{ "clear",    "Delete all system logs (logs)." },
	});
	parser.process(app);

	const QStringList args = parser.positionalArguments();
	if (args.isEmpty()) {
		parser.showHelp(ExitError);
	}
	const QString command = args.first();

	int rc = ExitError;
	try {
		// --config 가 없으면 설치 경로의 설정 파일을 사용 (없으면 기본값)
		QString configPath = parser.value("config");
		if (configPath.isEmpty() && QFile::exists(QStringLiteral(CONFIG_PATH CONFIG_FILE))) {
			configPath = QStringLiteral(CONFIG_PATH CONFIG_FILE);
		}
		const AppConfig cfg = AppConfig::load(configPath);

		if (!QDir().mkpath(cfg.logDir)) {
			qWarning() << "[main] cannot create log dir" << cfg.logDir;
		}
		Logger::configure(cfg.logDir.toStdString(), cfg.logLevel);
		Logger::installMessageHandler();

		// DB 준비
		QSqliteService db(cfg.databasePath);
		if (!db.initializeDatabase()) {
			return fail("Database initialization failed: " + cfg.databasePath);
		}

		// 시스템로거 준비
		SystemLogger::init(cfg.databasePath);
		LOG_INFO(QString("command=%1 db=%2").arg(command, cfg.databasePath));

		rc = runCommand(command, parser, cfg, db);
	} catch (const ConfigError& e) {
		qCritical() << "[main] config error:" << e.what();
		rc = fail(QString::fromUtf8(e.what()));
	} catch (const ImageDecodeError& e) {
		qWarning() << "[main] image decode error:" << e.what();
		rc = fail(QString::fromUtf8(e.what()));
	} catch (const std::exception& e) {
		qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		SystemLogger::critical("APP", QStringLiteral("Fatal exception"), QString::fromUtf8(e.what()));
		rc = fail(QString::fromUtf8(e.what()));
	}

	SystemLogger::shutdown();
	return rc;
}
