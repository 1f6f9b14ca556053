#include <QtTest/QtTest>

#include "monitors/linux/AudioControllerLinux.h"

namespace {
pa_cvolume stereo(pa_volume_t left, pa_volume_t right)
{
    pa_cvolume volume;
    pa_cvolume_init(&volume);
    volume.channels = 2;
    volume.values[0] = left;
    volume.values[1] = right;
    return volume;
}

float averageLevel(const pa_cvolume &volume)
{
    return static_cast<float>(pa_cvolume_avg(&volume)) / static_cast<float>(PA_VOLUME_NORM);
}
}

class AudioControllerLinuxTest : public QObject
{
    Q_OBJECT

private slots:
    void testRestoresUnevenBalance() {
        const pa_cvolume balance = stereo(PA_VOLUME_NORM, PA_VOLUME_NORM / 2);

        pa_cvolume restored = AudioControllerLinux::channelVolumes(balance, 2, averageLevel(balance));

        QCOMPARE(int(restored.channels), 2);
        QCOMPARE(restored.values[0], pa_volume_t(PA_VOLUME_NORM));
        QCOMPARE(restored.values[1], pa_volume_t(PA_VOLUME_NORM / 2));
    }

    void testRestoresOddChannelValues() {
        const pa_cvolume balance = stereo(60001, 23457);

        pa_cvolume restored = AudioControllerLinux::channelVolumes(balance, 2, averageLevel(balance));

        QCOMPARE(restored.values[0], pa_volume_t(60001));
        QCOMPARE(restored.values[1], pa_volume_t(23457));
    }

    void testQuietLevelSilencesEveryChannel() {
        const pa_cvolume balance = stereo(PA_VOLUME_NORM, PA_VOLUME_NORM / 4);

        pa_cvolume quiet = AudioControllerLinux::channelVolumes(balance, 2, 0.0f);

        QCOMPARE(quiet.values[0], pa_volume_t(PA_VOLUME_MUTED));
        QCOMPARE(quiet.values[1], pa_volume_t(PA_VOLUME_MUTED));
    }

    void testKeepsRatioAtNewLevel() {
        const pa_cvolume balance = stereo(48000, 16000);

        pa_cvolume scaled = AudioControllerLinux::channelVolumes(balance, 2, 0.5f);

        QCOMPARE(pa_cvolume_avg(&scaled), pa_volume_t(PA_VOLUME_NORM / 2));
        QCOMPARE(scaled.values[0], pa_volume_t(49152));
        QCOMPARE(scaled.values[1], pa_volume_t(16384));
    }

    void testFlatWithoutUsableBalance() {
        pa_cvolume unset;
        pa_cvolume_init(&unset);

        pa_cvolume flat = AudioControllerLinux::channelVolumes(unset, 6, 0.25f);
        QCOMPARE(int(flat.channels), 6);
        for (int i = 0; i < 6; ++i) {
            QCOMPARE(flat.values[i], pa_volume_t(PA_VOLUME_NORM / 4));
        }

        pa_cvolume silent = AudioControllerLinux::channelVolumes(stereo(0, 0), 2, 0.25f);
        QCOMPARE(silent.values[0], pa_volume_t(PA_VOLUME_NORM / 4));
        QCOMPARE(silent.values[1], pa_volume_t(PA_VOLUME_NORM / 4));
    }
};

QTEST_MAIN(AudioControllerLinuxTest)
#include "AudioControllerLinuxTest.moc"
