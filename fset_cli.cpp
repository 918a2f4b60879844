#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QDebug>

#include "fsetconfig.h"
#include "tablestore.h"
#include "repository.h"
#include "projects.h"

/*
 *  fset_cli [--config FILE] create [KEY] [--description TEXT]
 *  fset_cli [--config FILE] show NAME
 *  fset_cli [--config FILE] apply NAME DIFF.json
 */

static int failWith(const QString& msg) {
    QTextStream(stderr) << msg << "\n";
    return 1;
}

static void printJson(const QJsonObject& obj) {
    QTextStream out(stdout);
    out << QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("fset_cli");

    QCommandLineParser parser;
    parser.setApplicationDescription("Proyectos, archivos y fmodels persistidos por diffs.");
    parser.addHelpOption();
    QCommandLineOption configOpt("config", "Archivo de configuración.", "FILE",
                                 QString::fromLatin1(FsetConfig::kDefaultFile));
    QCommandLineOption descOpt("description", "Descripción del proyecto (create).", "TEXT");
    parser.addOption(configOpt);
    parser.addOption(descOpt);
    parser.addPositionalArgument("command", "create | show | apply");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(2);
    }

    FsetConfig cfg;
    QString cfgErr;
    if (!cfg.load(parser.value(configOpt), &cfgErr)) return failWith(cfgErr);
    cfg.applyLogRules();

    Repository repo(TableStore::instance());
    FsetError err;
    if (!repo.open(cfg.dataFile(), &err)) return failWith(err.toString());

    SystemIdProvider ids;
    Projects projects(repo, ids, cfg.defaultKeyPrefix());

    const QString cmd = args.first();

    if (cmd == "create") {
        QVariantMap params;
        if (args.size() > 1) params.insert("key", args.at(1));
        if (parser.isSet(descOpt)) params.insert("description", parser.value(descOpt));

        Project p;
        if (!projects.create(params, &p, &err)) return failWith(err.toString());
        printJson(Projects::toProjectSch(p));
        return 0;
    }

    if (cmd == "show") {
        if (args.size() < 2) return failWith("Uso: fset_cli show NAME");
        Project p;
        if (!projects.getProject(args.at(1), &p, &err)) return failWith(err.toString());
        printJson(Projects::toProjectSch(p));
        return 0;
    }

    if (cmd == "apply") {
        if (args.size() < 3) return failWith("Uso: fset_cli apply NAME DIFF.json");

        QFile f(args.at(2));
        if (!f.open(QIODevice::ReadOnly))
            return failWith(QString("No se pudo abrir %1").arg(args.at(2)));
        QJsonParseError pe;
        const auto doc = QJsonDocument::fromJson(f.readAll(), &pe);
        if (pe.error != QJsonParseError::NoError || !doc.isObject())
            return failWith(QString("Diff inválido en %1: %2").arg(args.at(2), pe.errorString()));

        Project p, after;
        if (!projects.getProject(args.at(1), &p, &err)) return failWith(err.toString());
        if (!projects.applyDiff(doc.object(), p, &after, &err)) return failWith(err.toString());
        printJson(Projects::toProjectSch(after));
        return 0;
    }

    return failWith(QString("Comando desconocido: %1").arg(cmd));
}
