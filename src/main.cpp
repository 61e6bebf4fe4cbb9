/************************************************************************\

    Modman - Mod folder manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include <QCommandLineParser>
#include <QDir>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QtQml/QQmlExtensionPlugin>

#include "AppSettings.h"
#include "Logging.h"
#include "OperationError.h"
#include "TagStore.h"

Q_IMPORT_QML_PLUGIN(ModmanPlugin)

namespace {

constexpr char tagFileName[] = ".tags.json";

QString resolveLibraryRoot(const QCommandLineParser &parser)
{
    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty() && QDir(positional.first()).exists()) {
        return QDir(positional.first()).absolutePath();
    }
    const QString stored = AppSettings::libraryRoot();
    if (!stored.isEmpty() && QDir(stored).exists()) {
        return stored;
    }
    return QDir::homePath();
}

} // namespace

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName("Modman");
    QCoreApplication::setOrganizationName("Modman");

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Two-pane mod folder manager"));
    parser.addHelpOption();
    parser.addPositionalArgument("library", QCoreApplication::translate("main", "Library folder to open."));
    const QCommandLineOption tagsOption(
        "tags",
        QCoreApplication::translate("main", "Tag file to use instead of <library>/.tags.json."),
        QCoreApplication::translate("main", "file"));
    parser.addOption(tagsOption);
    parser.process(app);

    const QString libraryRoot = resolveLibraryRoot(parser);
    AppSettings::setLibraryRoot(libraryRoot);

    const QString tagPath = parser.isSet(tagsOption)
        ? QDir(parser.value(tagsOption)).absolutePath()
        : QDir(libraryRoot).filePath(QLatin1String(tagFileName));

    TagStore tagStore;
    OperationError loadError;
    if (!tagStore.load(tagPath, &loadError)) {
        qCWarning(lcTags) << "starting with empty tags:" << loadError.message << loadError.path;
    }
    qCInfo(lcPane) << "library" << libraryRoot << "tags" << tagPath;

    QQmlApplicationEngine engine;
    engine.rootContext()->setContextProperty("tagStore", &tagStore);
    engine.rootContext()->setContextProperty("libraryRoot", libraryRoot);
    engine.rootContext()->setContextProperty("startupWarning", loadError.message);
    const QUrl url(u"qrc:/Modman/qml/App/Main.qml"_qs);
    QObject::connect(
        &engine,
        &QQmlApplicationEngine::objectCreated,
        &app,
        [url](QObject *obj, const QUrl &objUrl) {
            if (!obj && url == objUrl) {
                QCoreApplication::exit(-1);
            }
        },
        Qt::QueuedConnection);

    engine.load(url);

    return app.exec();
}
