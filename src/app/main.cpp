#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QStringList>

#include "session/SessionHost.hpp"
#include "session/api/ISessionStateManager.hpp"
#include "session/monitor/FileChangeMonitor.hpp"
#include "session/state/SessionConfigStore.hpp"

#include <memory>

static void printErrors(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

static bool parseNonNegative(const QCommandLineParser& parser, const QCommandLineOption& option, int& out)
{
	if (!parser.isSet(option))
		return true;

	bool ok = false;
	const int value = parser.value(option).toInt(&ok);
	if (!ok || value < 0) {
		qCritical().noquote() << "Invalid value for --" + option.names().constFirst() + ":" << parser.value(option);
		return false;
	}
	out = value;
	return true;
}

int main(int argc, char** argv)
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("qalam-session"));
	QCoreApplication::setOrganizationName(QStringLiteral("Qalam"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Tracks open files, auto-saves them and rotates their backups."));
	parser.addHelpOption();
	parser.addPositionalArgument(QStringLiteral("files"), QStringLiteral("Files to open."), QStringLiteral("[files...]"));

	const QCommandLineOption sessionOption(QStringLiteral("session"),
										   QStringLiteral("Session key (defaults to the working directory)."),
										   QStringLiteral("key"));
	const QCommandLineOption backupRootOption(QStringLiteral("backup-root"),
											  QStringLiteral("Directory that receives all backups."),
											  QStringLiteral("dir"));
	const QCommandLineOption intervalOption(QStringLiteral("autosave-interval"),
											QStringLiteral("Seconds between auto-save cycles."),
											QStringLiteral("seconds"));
	const QCommandLineOption pollOption(QStringLiteral("poll-interval"),
										QStringLiteral("Milliseconds between file polls, 0 to disable."),
										QStringLiteral("ms"));
	const QCommandLineOption syncOption(QStringLiteral("sync"), QStringLiteral("Auto-save on the main thread."));
	const QCommandLineOption onceOption(QStringLiteral("once"),
										QStringLiteral("Open the files, flush them and exit."));
	parser.addOptions({sessionOption, backupRootOption, intervalOption, pollOption, syncOption, onceOption});
	parser.process(app);

	const QString sessionKey = parser.isSet(sessionOption) ? parser.value(sessionOption) : QDir::currentPath();
	auto store = std::make_unique<Session::Internal::SessionConfigStore>(
		Session::Internal::SessionConfigStore::makeEnvironment(sessionKey));

	Session::Api::SessionConfig config = store->loadConfig();
	if (parser.isSet(backupRootOption))
		config.backupRoot = parser.value(backupRootOption);
	if (parser.isSet(syncOption))
		config.asyncIo = false;
	if (!parseNonNegative(parser, intervalOption, config.autosaveIntervalSeconds))
		return EXIT_FAILURE;

	int pollMs = 0;
	if (!parseNonNegative(parser, pollOption, pollMs))
		return EXIT_FAILURE;

	// Command line overrides apply to this run only.
	Session::SessionHost host(std::move(store));
	const QStringList notReopened = host.start(config);
	if (!notReopened.isEmpty())
		printErrors(QStringLiteral("Could not reopen documents from the last session:"), notReopened);

	host.monitor()->setPollIntervalMs(pollMs);

	QStringList openErrors;
	const QStringList files = parser.positionalArguments();
	for (const QString& file : files) {
		Session::Api::DocumentInfo document;
		const Session::Api::SessionResult opened = host.manager()->openDocument(file, document);
		if (!opened)
			openErrors.append(opened.errors);
	}
	if (!openErrors.isEmpty())
		printErrors(QStringLiteral("Failed to open documents."), openErrors);

	if (parser.isSet(onceOption)) {
		const Session::Api::SessionResult stopped = host.shutdown();
		if (!stopped) {
			printErrors(QStringLiteral("Shutdown reported errors."), stopped.errors);
			return EXIT_FAILURE;
		}
		return openErrors.isEmpty() ? EXIT_SUCCESS : EXIT_FAILURE;
	}

	QObject::connect(&app, &QCoreApplication::aboutToQuit, &host, [&host]() {
		const Session::Api::SessionResult stopped = host.shutdown();
		if (!stopped)
			printErrors(QStringLiteral("Shutdown reported errors."), stopped.errors);
	});

	return app.exec();
}
