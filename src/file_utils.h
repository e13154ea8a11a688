#pragma once

#include <QString>
#include <QStringList>
#include <QFileInfo>
#include <QFile>
#include <QDir>
#include <QDirIterator>

/**
 * FileUtils - file naming and discovery helpers shared by the queue and the worker.
 */
namespace FileUtils {

/**
 * Check if a file exists at the given path.
 *
 * @param filePath The file path to check
 * @return true if the file exists and is a regular file, false otherwise
 */
inline bool fileExists(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() && fi.isFile();
}

/**
 * Pick an output path in outDir named after the input file's stem.
 * "<stem>.<ext>" is used when free, otherwise "<stem> (1).<ext>", "<stem> (2).<ext>", ...
 *
 * @param outDir Target folder
 * @param inputPath Source file; only its stem is used
 * @param ext Target extension, with or without the leading dot
 */
inline QString safeOutputName(const QString& outDir, const QString& inputPath, const QString& ext)
{
    QString cleanExt = ext;
    while (cleanExt.startsWith('.')) cleanExt.remove(0, 1);
    const QString base = QFileInfo(inputPath).completeBaseName();
    const QDir dir(outDir);
    const QString first = dir.filePath(QString("%1.%2").arg(base, cleanExt));
    if (!QFileInfo::exists(first)) return first;
    for (int i = 1; ; ++i) {
        const QString cand = dir.filePath(QString("%1 (%2).%3").arg(base, QString::number(i), cleanExt));
        if (!QFileInfo::exists(cand)) return cand;
    }
}

/**
 * All regular files below dirPath, recursively, in a stable sorted order.
 */
inline QStringList collectFilesRecursive(const QString& dirPath)
{
    QStringList out;
    QDirIterator it(dirPath, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) out << it.next();
    out.sort();
    return out;
}

} // namespace FileUtils
