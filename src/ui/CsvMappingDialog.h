#pragma once

#include <QDialog>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QStringList>
#include "SubtitleData.h"

// Lets the user say which CSV columns hold the start, end and text.
class CsvMappingDialog : public QDialog {
    Q_OBJECT
public:
    CsvMappingDialog(const QString& csvPath, const QStringList& header,
                     const CsvMapping& current, QWidget* parent = nullptr);
    ~CsvMappingDialog();

    CsvMapping mapping() const;

private:
    void fillColumns(QComboBox* combo, bool allowNone);
    void selectColumn(QComboBox* combo, const QString& column);

    QStringList m_header;
    QComboBox* m_startCombo;
    QComboBox* m_endCombo;
    QComboBox* m_textCombo;
    QComboBox* m_unitCombo;
    QDoubleSpinBox* m_fpsSpin;
};
