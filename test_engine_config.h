#include <QByteArray>           // for QByteArray
#include <QObject>              // for QObject, Q_OBJECT, slots
#include <QString>              // for QString
#include <QTemporaryDir>        // for QTemporaryDir

class EngineConfigTest : public QObject
{
  Q_OBJECT

private:
  /* Member Functions */

  QString write_ini(const QString& name, const QByteArray& contents);

  /* Data Members */

  QTemporaryDir dir_;

private slots:
  void cleanup();

  void defaults();
  void loadsAllSections();
  void keysAreCaseInsensitive();
  void partialFileKeepsDefaults();
  void environmentSelectsFile();
  void missingEnvironmentFileUsesDefaults();
  void missingExplicitFileThrows();
  void invalidNumberThrows();
  void negativeValueThrows();
  void nonFiniteValueThrows();
  void unknownPolicyThrows();
  void entryOutsideSectionThrows();
};
