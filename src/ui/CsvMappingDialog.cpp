#include "CsvMappingDialog.h"
#include "AppConstants.h"
#include "CsvParser.h"

#include <QDialogButtonBox>
#include <QFileInfo>
#include <QFormLayout>
#include <QLabel>
#include <QVBoxLayout>

CsvMappingDialog::CsvMappingDialog(const QString& csvPath, const QStringList& header,
                                   const CsvMapping& current, QWidget* parent)
    : QDialog(parent)
    , m_header(header)
{
    setWindowTitle(QString("CSV Columns - %1").arg(QFileInfo(csvPath).fileName()));

    auto* layout = new QVBoxLayout(this);
    auto* form = new QFormLayout();

    m_startCombo = new QComboBox(this);
    fillColumns(m_startCombo, false);
    form->addRow("Start time:", m_startCombo);

    m_endCombo = new QComboBox(this);
    fillColumns(m_endCombo, true);
    m_endCombo->setToolTip(QString("Without an end column each line is shown for %1 s")
                               .arg(AppConstants::DefaultCueDuration));
    form->addRow("End time:", m_endCombo);

    m_textCombo = new QComboBox(this);
    fillColumns(m_textCombo, false);
    form->addRow("Text:", m_textCombo);

    m_unitCombo = new QComboBox(this);
    m_unitCombo->addItem("Seconds", static_cast<int>(CsvTimeUnit::Seconds));
    m_unitCombo->addItem("Frames", static_cast<int>(CsvTimeUnit::Frames));
    form->addRow("Time unit:", m_unitCombo);

    m_fpsSpin = new QDoubleSpinBox(this);
    m_fpsSpin->setRange(1.0, 240.0);
    m_fpsSpin->setDecimals(3);
    form->addRow("Frames per second:", m_fpsSpin);

    layout->addLayout(form);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    layout->addWidget(buttons);

    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(m_unitCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this]() {
        m_fpsSpin->setEnabled(m_unitCombo->currentData().toInt() == static_cast<int>(CsvTimeUnit::Frames));
    });

    selectColumn(m_startCombo, current.startColumn);
    selectColumn(m_endCombo, current.endColumn);
    selectColumn(m_textCombo, current.textColumn);
    m_unitCombo->setCurrentIndex(current.timeUnit == CsvTimeUnit::Frames ? 1 : 0);
    m_fpsSpin->setValue(current.fps);
    m_fpsSpin->setEnabled(current.timeUnit == CsvTimeUnit::Frames);
}

CsvMappingDialog::~CsvMappingDialog() = default;

void CsvMappingDialog::fillColumns(QComboBox* combo, bool allowNone) {
    if (allowNone)
        combo->addItem("<none>", QString());

    for (int i = 0; i < m_header.size(); ++i) {
        // Unnamed or repeated headers can only be addressed by index
        const QString& name = m_header.at(i);
        bool unique = !name.isEmpty() && m_header.count(name) == 1;
        QString label = name.isEmpty() ? QString("Column %1").arg(i + 1) : name;
        combo->addItem(label, unique ? name : QString::number(i));
    }
}

void CsvMappingDialog::selectColumn(QComboBox* combo, const QString& column) {
    if (column.isEmpty()) {
        combo->setCurrentIndex(0);
        return;
    }

    int index = CsvParser::resolveColumn(m_header, column);
    if (index < 0) return;

    int offset = combo->count() - m_header.size();
    combo->setCurrentIndex(index + offset);
}

CsvMapping CsvMappingDialog::mapping() const {
    CsvMapping m;
    m.startColumn = m_startCombo->currentData().toString();
    m.endColumn = m_endCombo->currentData().toString();
    m.textColumn = m_textCombo->currentData().toString();
    m.timeUnit = static_cast<CsvTimeUnit>(m_unitCombo->currentData().toInt());
    m.fps = m_fpsSpin->value();
    return m;
}
